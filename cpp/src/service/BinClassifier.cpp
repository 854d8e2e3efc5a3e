#include "cardforge/service/BinClassifier.hpp"
#include "cardforge/generator/CardLayout.hpp"
#include "cardforge/util/Logging.hpp"
#include "cardforge/util/StringUtil.hpp"

#include <exception>

namespace cardforge::service {

BinClassifier::BinClassifier(repository::BinStore& bins, repository::BlocklistStore& blocklist)
    : bins_(bins)
    , blocklist_(blocklist) {}

std::optional<std::string> BinClassifier::normalizePrefix(std::string_view input) {
    const std::string trimmed = util::trim(input);
    if (trimmed.size() < 6 || trimmed.size() > 8 || !util::isAllDigits(trimmed)) {
        return std::nullopt;
    }
    return trimmed.substr(0, generator::kPrefixLength);
}

ClassifyResult BinClassifier::classify(const std::string& prefixInput) {
    ClassifyResult result;

    auto prefix = normalizePrefix(prefixInput);
    if (!prefix) {
        result.error = ErrorCode::InvalidFormat;
        result.message = "BIN must be 6 to 8 digits";
        return result;
    }
    result.prefix = *prefix;

    try {
        if (auto blocked = blocklist_.isBlocked(*prefix)) {
            result.error = ErrorCode::Blocked;
            result.message = blocked->reason;
            return result;
        }

        auto record = bins_.lookupBin(*prefix);
        if (!record) {
            result.error = ErrorCode::NotFound;
            result.message = "BIN not found in database";
            return result;
        }
        result.record = std::move(record);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "BIN lookup failed for " + *prefix + ": " + ex.what());
        result.error = ErrorCode::StoreUnavailable;
        result.message = "BIN metadata store unavailable";
        return result;
    }

    result.success = true;
    result.message = "Valid BIN";
    return result;
}

} // namespace cardforge::service
