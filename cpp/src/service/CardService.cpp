#include "cardforge/service/CardService.hpp"
#include "cardforge/generator/CardLayout.hpp"
#include "cardforge/generator/ChecksumResolver.hpp"
#include "cardforge/util/Errors.hpp"
#include "cardforge/util/Logging.hpp"
#include "cardforge/util/StringUtil.hpp"

#include <exception>
#include <utility>

namespace cardforge::service {
namespace {
template <typename Result>
Result failure(ErrorCode error, std::string message) {
    Result result;
    result.error = error;
    result.message = std::move(message);
    return result;
}
} // namespace

CardService::CardService(BinClassifier& classifier, CardServiceSettings settings, ClockFn clock)
    : classifier_(classifier)
    , settings_(settings)
    , clock_(clock ? std::move(clock) : ClockFn{[] { return std::chrono::system_clock::now(); }})
    , synthesizer_(settings.maxReshuffles) {}

GenerateResult CardService::generate(const std::string& prefixInput, const GenerateOptions& options) {
    return generate(prefixInput, options, util::threadEngine());
}

GenerateResult CardService::generate(const std::string& prefixInput,
                                     const GenerateOptions& options,
                                     util::RandomEngine& rng) {
    auto classified = classifier_.classify(prefixInput);
    if (!classified.success) {
        return failure<GenerateResult>(classified.error, classified.message);
    }
    if (auto avsError = checkAvs(options)) {
        return *avsError;
    }

    try {
        GenerateResult result;
        result.card = assemble(classified.prefix, *classified.record, options, rng, clock_());
        result.success = true;
        result.message = "Card generated";
        return result;
    } catch (const util::InvariantViolation& ex) {
        util::log(util::LogLevel::error, std::string{"Card generation invariant broken: "} + ex.what());
        return failure<GenerateResult>(ErrorCode::InvariantViolation, "internal error");
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Card generation failed: "} + ex.what());
        return failure<GenerateResult>(ErrorCode::Internal, "internal error");
    }
}

BatchResult CardService::generateBatch(const std::string& prefixInput, int count, const GenerateOptions& options) {
    if (count < 1 || count > settings_.maxBatchSize) {
        return failure<BatchResult>(ErrorCode::InvalidRequest,
                                    "Count must be between 1 and " + std::to_string(settings_.maxBatchSize));
    }

    auto classified = classifier_.classify(prefixInput);
    if (!classified.success) {
        return failure<BatchResult>(classified.error, classified.message);
    }
    if (auto avsError = checkAvs(options)) {
        return failure<BatchResult>(avsError->error, avsError->message);
    }

    auto& rng = util::threadEngine();
    const auto now = clock_();
    BatchResult batch;
    batch.cards.reserve(static_cast<std::size_t>(count));
    try {
        for (int i = 0; i < count; ++i) {
            batch.cards.push_back(assemble(classified.prefix, *classified.record, options, rng, now));
        }
    } catch (const util::InvariantViolation& ex) {
        util::log(util::LogLevel::error, std::string{"Batch generation invariant broken: "} + ex.what());
        return failure<BatchResult>(ErrorCode::InvariantViolation, "internal error");
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Batch generation failed: "} + ex.what());
        return failure<BatchResult>(ErrorCode::Internal, "internal error");
    }

    batch.record = std::move(classified.record);
    batch.record->prefix = classified.prefix;
    batch.success = true;
    batch.message = std::to_string(count) + " cards generated";
    return batch;
}

std::optional<GenerateResult> CardService::checkAvs(const GenerateOptions& options) const {
    if (!options.includeAvs) {
        return std::nullopt;
    }
    if (util::trim(options.avsCountry).empty()) {
        return failure<GenerateResult>(ErrorCode::InvalidRequest, "AVS generation requires avsCountry");
    }
    if (!avs_.supports(options.avsCountry)) {
        return failure<GenerateResult>(ErrorCode::UnsupportedAvsCountry,
                                       "AVS not supported for country: " + options.avsCountry);
    }
    return std::nullopt;
}

model::GeneratedCard CardService::assemble(const std::string& prefix,
                                           const model::BinRecord& record,
                                           const GenerateOptions& options,
                                           util::RandomEngine& rng,
                                           std::chrono::system_clock::time_point now) const {
    const auto brand = model::brandFromName(record.brand);
    const auto length = generator::cardLengthFor(brand, record.category, prefix);

    auto synthesized = synthesizer_.synthesize(prefix, length, rng);

    model::GeneratedCard card;
    card.number = generator::ChecksumResolver::solve(prefix + synthesized.digits);
    if (card.number.compare(0, prefix.size(), prefix) != 0 || card.number.size() != length) {
        throw util::InvariantViolation("assembled number lost prefix " + prefix);
    }
    card.expiry = expiryGenerator_.generate(record.category, now, rng);
    card.cvv = cvvDeriver_.derive(card.number, card.expiry, options.seededCvv, rng);
    if (options.includeAvs) {
        card.postalCode = avs_.pairPostalCode(options.avsCountry, rng);
        if (!card.postalCode) {
            throw util::InvariantViolation("AVS country passed validation but has no postal codes");
        }
    }
    card.bin = prefix;
    card.brand = record.brand;
    card.category = record.category;
    card.issuer = record.issuer;
    card.country = record.country;
    card.countryName = record.countryName;
    card.generatedAt = now;
    return card;
}

} // namespace cardforge::service
