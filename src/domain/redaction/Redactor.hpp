/**
 * @file Redactor.hpp
 * @brief Deterministic substitution of sensitive spans with fixed placeholders.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "domain/redaction/RedactionDictionary.hpp"

namespace reflectcore::domain::redaction {

struct RedactionResult {
    std::string redactedText;
    std::string inputHash;  ///< Fingerprint of the raw input.
    bool didRedact = false;
};

/**
 * @enum MatchKind
 * @brief Kinds of redacted span. Higher value wins when two candidates overlap.
 */
enum class MatchKind {
    Custom = 10,
    Vat = 20,
    Utr = 21,
    Nino = 22,
    Postcode = 23,
    SortCode = 24,
    Phone = 25,
    Account = 26,
    CardUnverified = 27,
    Card = 28,
    Bic = 29,
    Iban = 30,
    Email = 31
};

std::string PlaceholderFor(MatchKind kind);

/**
 * @class Redactor
 * @brief Stateless redaction engine.
 *
 * Scan order is fixed: structural PII matches are collected on the original text and
 * resolved by priority, then length, then position. Dictionary tokens (trimmed, longest
 * first, Unicode case-folded, whole-token only) fill the remaining spans. Replacements are
 * applied once, left to right, so the output does not depend on token order.
 */
class Redactor {
public:
    RedactionResult redact(const std::string& rawText, const RedactionDictionary& dictionary) const;

private:
    struct Match {
        std::size_t pos;
        std::size_t len;
        MatchKind kind;
    };

    std::vector<Match> structuralMatches(const std::string& input) const;
    std::vector<Match> customMatches(const std::string& input,
                                     const std::vector<std::string>& tokens,
                                     const std::vector<Match>& occupied) const;
    static std::vector<Match> chooseNonOverlapping(std::vector<Match> candidates);
    static std::string apply(const std::vector<Match>& matches, const std::string& input);
};

} // namespace reflectcore::domain::redaction
