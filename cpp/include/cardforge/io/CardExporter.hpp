#pragma once

#include "cardforge/model/GeneratedCard.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cardforge::io {

enum class ExportFormat {
    Json,
    Csv,
    Xml
};

std::optional<ExportFormat> parseExportFormat(std::string_view name);
std::string_view contentType(ExportFormat format);
std::string_view fileExtension(ExportFormat format);

// Flat field view shared by every format. `formatted` groups the number for display.
boost::json::object cardToJson(const model::GeneratedCard& card, bool formatted = false);

class CardExporter {
public:
    std::string exportCards(const std::vector<model::GeneratedCard>& cards,
                            ExportFormat format,
                            std::chrono::system_clock::time_point exportedAt) const;

    // Throws std::invalid_argument for a format name outside json/csv/xml.
    std::string exportCards(const std::vector<model::GeneratedCard>& cards,
                            std::string_view formatName,
                            std::chrono::system_clock::time_point exportedAt) const;

    std::string toJson(const std::vector<model::GeneratedCard>& cards,
                       std::chrono::system_clock::time_point exportedAt) const;
    std::string toCsv(const std::vector<model::GeneratedCard>& cards) const;
    std::string toXml(const std::vector<model::GeneratedCard>& cards,
                      std::chrono::system_clock::time_point exportedAt) const;
};

} // namespace cardforge::io
