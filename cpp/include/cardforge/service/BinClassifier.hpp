#pragma once

#include "cardforge/model/BinRecord.hpp"
#include "cardforge/repository/BinStore.hpp"
#include "cardforge/service/ErrorCode.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace cardforge::service {

struct ClassifyResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string message;
    std::string prefix;
    std::optional<model::BinRecord> record;
};

class BinClassifier {
public:
    BinClassifier(repository::BinStore& bins, repository::BlocklistStore& blocklist);

    ClassifyResult classify(const std::string& prefixInput);

    // Trimmed input of 6..8 digits reduced to its first six; nullopt otherwise.
    static std::optional<std::string> normalizePrefix(std::string_view input);

private:
    repository::BinStore& bins_;
    repository::BlocklistStore& blocklist_;
};

} // namespace cardforge::service
