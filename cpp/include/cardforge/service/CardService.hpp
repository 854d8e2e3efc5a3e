#pragma once

#include "cardforge/generator/AvsPairing.hpp"
#include "cardforge/generator/CvvDeriver.hpp"
#include "cardforge/generator/DigitSynthesizer.hpp"
#include "cardforge/generator/ExpiryGenerator.hpp"
#include "cardforge/model/GeneratedCard.hpp"
#include "cardforge/service/BinClassifier.hpp"
#include "cardforge/service/ErrorCode.hpp"
#include "cardforge/util/Random.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cardforge::service {

struct GenerateOptions {
    bool includeAvs{false};
    std::string avsCountry;
    bool seededCvv{true};
};

struct GenerateResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string message;
    std::optional<model::GeneratedCard> card;
};

struct BatchResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string message;
    std::optional<model::BinRecord> record;
    std::vector<model::GeneratedCard> cards;
};

struct CardServiceSettings {
    int maxReshuffles{generator::DigitSynthesizer::kDefaultMaxReshuffles};
    int maxBatchSize{1000};
};

class CardService {
public:
    using ClockFn = std::function<std::chrono::system_clock::time_point()>;

    explicit CardService(BinClassifier& classifier,
                         CardServiceSettings settings = {},
                         ClockFn clock = {});

    GenerateResult generate(const std::string& prefixInput, const GenerateOptions& options);
    GenerateResult generate(const std::string& prefixInput,
                            const GenerateOptions& options,
                            util::RandomEngine& rng);

    // One classification, `count` independent cards. Fails as a whole.
    BatchResult generateBatch(const std::string& prefixInput, int count, const GenerateOptions& options);

    const generator::AvsPairing& avs() const noexcept { return avs_; }
    const CardServiceSettings& settings() const noexcept { return settings_; }

private:
    std::optional<GenerateResult> checkAvs(const GenerateOptions& options) const;
    // `prefix` is the classifier's normalized prefix; the record only supplies metadata.
    model::GeneratedCard assemble(const std::string& prefix,
                                  const model::BinRecord& record,
                                  const GenerateOptions& options,
                                  util::RandomEngine& rng,
                                  std::chrono::system_clock::time_point now) const;

    BinClassifier& classifier_;
    CardServiceSettings settings_;
    ClockFn clock_;
    generator::DigitSynthesizer synthesizer_;
    generator::CvvDeriver cvvDeriver_;
    generator::ExpiryGenerator expiryGenerator_;
    generator::AvsPairing avs_;
};

} // namespace cardforge::service
