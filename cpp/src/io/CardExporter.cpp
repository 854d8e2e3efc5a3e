#include "cardforge/io/CardExporter.hpp"
#include "cardforge/util/JsonUtil.hpp"
#include "cardforge/util/StringUtil.hpp"
#include "cardforge/util/TimeFormat.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <array>
#include <stdexcept>
#include <sstream>

namespace cardforge::io {
namespace {
constexpr std::array<std::string_view, 11> kCsvColumns{
    "number", "cvv", "expiry", "bin", "brand", "issuer",
    "type", "country", "country_code", "postal_code", "generated_at"};

std::string csvQuote(const std::string& value) {
    std::string out{"\""};
    for (char ch : value) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

std::string fieldText(const boost::json::object& row, std::string_view key) {
    auto it = row.find(key);
    if (it == row.end() || it->value().is_null()) {
        return {};
    }
    if (it->value().is_string()) {
        return std::string(it->value().as_string().c_str());
    }
    return util::stringifyJson(it->value());
}
} // namespace

std::optional<ExportFormat> parseExportFormat(std::string_view name) {
    auto upper = util::toUpper(util::trim(name));
    if (upper == "JSON") {
        return ExportFormat::Json;
    }
    if (upper == "CSV") {
        return ExportFormat::Csv;
    }
    if (upper == "XML") {
        return ExportFormat::Xml;
    }
    return std::nullopt;
}

std::string_view contentType(ExportFormat format) {
    switch (format) {
    case ExportFormat::Json:
        return "application/json";
    case ExportFormat::Csv:
        return "text/csv";
    case ExportFormat::Xml:
        return "application/xml";
    }
    return "application/octet-stream";
}

std::string_view fileExtension(ExportFormat format) {
    switch (format) {
    case ExportFormat::Json:
        return "json";
    case ExportFormat::Csv:
        return "csv";
    case ExportFormat::Xml:
        return "xml";
    }
    return "bin";
}

boost::json::object cardToJson(const model::GeneratedCard& card, bool formatted) {
    boost::json::object row;
    row["number"] = formatted ? model::formatCardNumber(card.number) : card.number;
    row["cvv"] = card.cvv;
    row["expiry"] = card.expiry.toString();
    row["bin"] = card.bin;
    row["brand"] = card.brand;
    row["issuer"] = card.issuer;
    row["type"] = std::string(model::toString(card.category));
    row["country"] = card.countryName;
    row["country_code"] = card.country;
    if (card.postalCode) {
        row["postal_code"] = *card.postalCode;
    } else {
        row["postal_code"] = nullptr;
    }
    row["generated_at"] = util::formatIsoTimestamp(card.generatedAt);
    return row;
}

std::string CardExporter::exportCards(const std::vector<model::GeneratedCard>& cards,
                                      ExportFormat format,
                                      std::chrono::system_clock::time_point exportedAt) const {
    switch (format) {
    case ExportFormat::Json:
        return toJson(cards, exportedAt);
    case ExportFormat::Csv:
        return toCsv(cards);
    case ExportFormat::Xml:
        return toXml(cards, exportedAt);
    }
    return {};
}

std::string CardExporter::exportCards(const std::vector<model::GeneratedCard>& cards,
                                      std::string_view formatName,
                                      std::chrono::system_clock::time_point exportedAt) const {
    auto format = parseExportFormat(formatName);
    if (!format) {
        throw std::invalid_argument("Unsupported export format: " + std::string(formatName));
    }
    return exportCards(cards, *format, exportedAt);
}

std::string CardExporter::toJson(const std::vector<model::GeneratedCard>& cards,
                                 std::chrono::system_clock::time_point exportedAt) const {
    boost::json::array rows;
    rows.reserve(cards.size());
    for (const auto& card : cards) {
        rows.push_back(cardToJson(card));
    }
    boost::json::object doc;
    doc["export_format"] = "json";
    doc["exported_at"] = util::formatIsoTimestamp(exportedAt);
    doc["count"] = cards.size();
    doc["cards"] = std::move(rows);
    return util::stringifyJson(doc);
}

std::string CardExporter::toCsv(const std::vector<model::GeneratedCard>& cards) const {
    std::ostringstream out;
    for (std::size_t i = 0; i < kCsvColumns.size(); ++i) {
        out << (i ? "," : "") << kCsvColumns[i];
    }
    out << "\r\n";
    for (const auto& card : cards) {
        auto row = cardToJson(card);
        for (std::size_t i = 0; i < kCsvColumns.size(); ++i) {
            out << (i ? "," : "") << csvQuote(fieldText(row, kCsvColumns[i]));
        }
        out << "\r\n";
    }
    return out.str();
}

std::string CardExporter::toXml(const std::vector<model::GeneratedCard>& cards,
                                std::chrono::system_clock::time_point exportedAt) const {
    namespace pt = boost::property_tree;
    pt::ptree root;
    root.put("cards.<xmlattr>.count", cards.size());
    root.put("cards.<xmlattr>.exported_at", util::formatIsoTimestamp(exportedAt));
    auto& list = root.get_child("cards");
    for (const auto& card : cards) {
        auto row = cardToJson(card);
        pt::ptree node;
        for (auto column : kCsvColumns) {
            node.put(std::string(column), fieldText(row, column));
        }
        list.add_child("card", node);
    }
    std::ostringstream out;
    pt::write_xml(out, root, pt::xml_writer_make_settings<std::string>(' ', 2));
    return out.str();
}

} // namespace cardforge::io
