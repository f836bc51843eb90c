/**
 * @file Redactor.cpp
 * @brief Implementation of the Redactor.
 */

#include "domain/redaction/Redactor.hpp"
#include "domain/CaseFolding.hpp"
#include "domain/Fingerprint.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <regex>

namespace reflectcore::domain::redaction {

namespace {

constexpr std::size_t kCardContextWindow = 28;

// std::regex recurses once per repeated character, so structural patterns run over
// bounded windows. Consecutive windows share kScanOverlap bytes, which is longer than
// any structural format (an email address is at most 254 bytes).
constexpr std::size_t kScanWindow = 2048;
constexpr std::size_t kScanOverlap = 256;

struct ScanWindow {
    std::size_t begin;
    std::size_t end;
    std::size_t keepBefore;  ///< Matches starting here or later belong to the next window.
};

std::vector<ScanWindow> ScanWindows(const std::string& input) {
    std::vector<ScanWindow> windows;
    std::size_t begin = 0;
    while (input.size() - begin > kScanWindow) {
        // Prefer to cut just after whitespace near the end of the window.
        std::size_t end = begin + kScanWindow;
        for (std::size_t i = end; i > begin + kScanWindow - kScanOverlap; --i) {
            if (std::isspace(static_cast<unsigned char>(input[i - 1]))) {
                end = i;
                break;
            }
        }
        windows.push_back({begin, end, end - kScanOverlap});
        begin = end - kScanOverlap;
    }
    windows.push_back({begin, input.size(), input.size()});
    return windows;
}

template <typename Fn>
void ForEachMatch(const std::string& input, const std::regex& re, Fn&& onMatch) {
    for (const auto& w : ScanWindows(input)) {
        // Later windows let \b look at the byte before the window.
        auto flags = w.begin > 0 ? std::regex_constants::match_prev_avail
                                 : std::regex_constants::match_default;
        auto first = input.begin() + static_cast<std::ptrdiff_t>(w.begin);
        auto last = input.begin() + static_cast<std::ptrdiff_t>(w.end);
        for (std::sregex_iterator it(first, last, re, flags), stop; it != stop; ++it) {
            const std::smatch& m = *it;
            if (static_cast<std::size_t>(m[0].first - input.begin()) >= w.keepBefore) continue;
            onMatch(m);
        }
    }
}

const std::regex& EmailPattern() {
    static const std::regex re(R"(\b[-A-Z0-9._%+]+@[-A-Z0-9.]+\.[A-Z]{2,}\b)", std::regex::icase);
    return re;
}

const std::regex& IntlPhonePattern() {
    static const std::regex re(R"((?:\+|\b00)\d{1,3}[-\s]?(?:\(?\d+\)?[-\s]?){3,}\d\b)", std::regex::icase);
    return re;
}

const std::regex& UkMobilePattern() {
    static const std::regex re(R"((?:\+44\s?7\d{3}|\(?\b07\d{3}\)?)\s?\d{3}\s?\d{3}\b)", std::regex::icase);
    return re;
}

const std::regex& PostcodePattern() {
    static const std::regex re(R"(\b([A-Z]{1,2}\d{1,2}[A-Z]?)\s?(\d[A-Z]{2})\b)", std::regex::icase);
    return re;
}

const std::regex& IbanPattern() {
    static const std::regex re(R"(\b[A-Z]{2}\d{2}[A-Z0-9]{11,30}\b)", std::regex::icase);
    return re;
}

const std::regex& IbanSpacedPattern() {
    static const std::regex re(R"(\b[A-Z]{2}\d{2}(?:[-\s]?[A-Z0-9]){11,40}\b)", std::regex::icase);
    return re;
}

const std::regex& SortCodeLabelledPattern() {
    static const std::regex re(R"(\b(sort\s*code|s/c)\s*(?:is|:)?\s*(\d{2}[-\s]?\d{2}[-\s]?\d{2})\b)", std::regex::icase);
    return re;
}

const std::regex& SortCodePattern() {
    static const std::regex re(R"(\b\d{2}[-\s]\d{2}[-\s]\d{2}\b)");
    return re;
}

const std::regex& AccountPattern() {
    static const std::regex re(
        R"(\b((?:bank\s*)?account(?:\s*(?:number|no\.?|#))?|acct(?:\.)?(?:\s*(?:number|no\.?|#))?|acc(?:\s*(?:number|no\.?|#))?|a/c)\s*(?:is|:)?\s*([0-9](?:[-0-9\s]{3,}[0-9])?)\b)",
        std::regex::icase);
    return re;
}

const std::regex& NinoPattern() {
    static const std::regex re(R"(\b[A-CEGHJ-PR-TW-Z]{2}\d{6}[A-D]\b)", std::regex::icase);
    return re;
}

const std::regex& UtrPattern() {
    static const std::regex re(R"(\b(utr|unique\s*taxpayer\s*reference)\s*(?:is|:)?\s*(\d{10})\b)", std::regex::icase);
    return re;
}

const std::regex& VatPattern() {
    static const std::regex re(R"(\b(vat\s*(?:number|no\.?|#))\s*(?:is|:)?\s*(?:GB)?\s*(\d{9}(?:\d{3})?)\b)", std::regex::icase);
    return re;
}

const std::regex& BicPattern() {
    static const std::regex re(R"(\b(?:bic|swift)(?:\s*code)?\s*(?:is|:)?\s*([A-Z0-9](?:[-A-Z0-9\s]{6,}[A-Z0-9])?)\b)", std::regex::icase);
    return re;
}

const std::regex& CardPattern() {
    static const std::regex re(R"(\b(?:\d[- ]*?){13,19}\b)");
    return re;
}

std::string AsciiLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string AlnumUpper(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c)) out += static_cast<char>(std::toupper(c));
    }
    return out;
}

std::vector<int> DigitsOf(const std::string& s) {
    std::vector<int> digits;
    for (unsigned char c : s) {
        if (std::isdigit(c)) digits.push_back(c - '0');
    }
    return digits;
}

bool LuhnValid(const std::vector<int>& digits) {
    if (digits.empty()) return false;
    int sum = 0;
    bool shouldDouble = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int n = *it;
        if (shouldDouble) {
            n *= 2;
            if (n > 9) n -= 9;
        }
        sum += n;
        shouldDouble = !shouldDouble;
    }
    return sum % 10 == 0;
}

bool HasCardContext(const std::string& input, std::size_t pos, std::size_t len) {
    std::size_t start = pos > kCardContextWindow ? pos - kCardContextWindow : 0;
    std::size_t end = std::min(input.size(), pos + len + kCardContextWindow);
    std::string context = AsciiLower(input.substr(start, end - start));

    static const char* keywords[] = {
        "card", "debit", "credit", "visa", "mastercard", "amex", "american express",
        "cvv", "cvc", "expiry", "expiration", "exp date"
    };
    for (const char* kw : keywords) {
        if (context.find(kw) != std::string::npos) return true;
    }
    return false;
}

} // namespace

std::string PlaceholderFor(MatchKind kind) {
    switch (kind) {
        case MatchKind::Email: return "[EMAIL]";
        case MatchKind::Phone: return "[PHONE]";
        case MatchKind::Postcode: return "[POSTCODE]";
        case MatchKind::Iban: return "[IBAN]";
        case MatchKind::Bic: return "[BIC]";
        case MatchKind::SortCode: return "[SORTCODE]";
        case MatchKind::Account: return "[ACCOUNT]";
        case MatchKind::Card: return "[CARD]";
        case MatchKind::CardUnverified: return "[CARD?]";
        case MatchKind::Nino: return "[NINO]";
        case MatchKind::Utr: return "[UTR]";
        case MatchKind::Vat: return "[VAT]";
        case MatchKind::Custom: return "[CUSTOM]";
        default: return "[REDACTED]";
    }
}

RedactionResult Redactor::redact(const std::string& rawText, const RedactionDictionary& dictionary) const {
    RedactionResult result;
    result.inputHash = Fingerprint(rawText);
    if (rawText.empty()) {
        result.redactedText = rawText;
        return result;
    }

    std::vector<Match> chosen = chooseNonOverlapping(structuralMatches(rawText));

    if (!dictionary.tokens.empty()) {
        std::vector<Match> custom = customMatches(rawText, dictionary.tokens, chosen);
        chosen.insert(chosen.end(), custom.begin(), custom.end());
        chosen = chooseNonOverlapping(std::move(chosen));
    }

    result.didRedact = !chosen.empty();
    result.redactedText = chosen.empty() ? rawText : apply(chosen, rawText);
    return result;
}

std::vector<Redactor::Match> Redactor::structuralMatches(const std::string& input) const {
    std::vector<Match> out;

    auto collect = [&](const std::regex& re, int group, MatchKind kind,
                       const std::function<bool(const std::string&)>& accept) {
        ForEachMatch(input, re, [&](const std::smatch& m) {
            if (static_cast<std::size_t>(group) >= m.size() || !m[group].matched || m.length(group) == 0) {
                return;
            }
            if (accept && !accept(m.str(group))) return;
            out.push_back({static_cast<std::size_t>(m[group].first - input.begin()),
                           static_cast<std::size_t>(m.length(group)), kind});
        });
    };

    collect(EmailPattern(), 0, MatchKind::Email, nullptr);
    collect(IntlPhonePattern(), 0, MatchKind::Phone, nullptr);
    collect(UkMobilePattern(), 0, MatchKind::Phone, nullptr);
    collect(PostcodePattern(), 0, MatchKind::Postcode, nullptr);
    collect(IbanPattern(), 0, MatchKind::Iban, nullptr);

    // Spaced IBANs tolerate transcription separators but must still look like one.
    collect(IbanSpacedPattern(), 0, MatchKind::Iban, [](const std::string& snippet) {
        std::string cleaned = AlnumUpper(snippet);
        return cleaned.size() >= 15 && cleaned.size() <= 34 &&
               std::isalpha(static_cast<unsigned char>(cleaned[0])) &&
               std::isalpha(static_cast<unsigned char>(cleaned[1])) &&
               std::isdigit(static_cast<unsigned char>(cleaned[2])) &&
               std::isdigit(static_cast<unsigned char>(cleaned[3]));
    });

    collect(SortCodeLabelledPattern(), 2, MatchKind::SortCode, nullptr);
    collect(SortCodePattern(), 0, MatchKind::SortCode, nullptr);

    collect(AccountPattern(), 2, MatchKind::Account, [](const std::string& snippet) {
        auto count = DigitsOf(snippet).size();
        return count >= 6 && count <= 12;
    });

    collect(NinoPattern(), 0, MatchKind::Nino, nullptr);
    collect(UtrPattern(), 2, MatchKind::Utr, nullptr);
    collect(VatPattern(), 2, MatchKind::Vat, nullptr);

    // BIC/SWIFT only next to its label; bare 8-letter words are too common.
    collect(BicPattern(), 1, MatchKind::Bic, [](const std::string& snippet) {
        std::string cleaned = AlnumUpper(snippet);
        if (cleaned.size() != 8 && cleaned.size() != 11) return false;
        for (std::size_t i = 0; i < 6; ++i) {
            if (!std::isalpha(static_cast<unsigned char>(cleaned[i]))) return false;
        }
        return true;
    });

    ForEachMatch(input, CardPattern(), [&](const std::smatch& m) {
        std::vector<int> digits = DigitsOf(m.str());
        if (digits.size() < 13 || digits.size() > 19) return;

        auto pos = static_cast<std::size_t>(m[0].first - input.begin());
        auto len = static_cast<std::size_t>(m.length());
        if (LuhnValid(digits)) {
            out.push_back({pos, len, MatchKind::Card});
        } else if (HasCardContext(input, pos, len)) {
            out.push_back({pos, len, MatchKind::CardUnverified});
        }
    });

    return out;
}

std::vector<Redactor::Match> Redactor::customMatches(const std::string& input,
                                                     const std::vector<std::string>& tokens,
                                                     const std::vector<Match>& occupied) const {
    using Needle = std::vector<std::int32_t>;
    std::vector<Needle> needles;
    for (const auto& t : tokens) {
        std::string trimmed = Trim(t);
        if (!trimmed.empty()) needles.push_back(FoldForMatching(trimmed).codePoints);
    }
    // Longest first; ties ordered by code point so the order is total.
    std::sort(needles.begin(), needles.end(), [](const Needle& a, const Needle& b) {
        if (a.size() != b.size()) return a.size() > b.size();
        return a < b;
    });
    needles.erase(std::unique(needles.begin(), needles.end()), needles.end());

    std::vector<Match> out;
    if (needles.empty()) return out;

    const FoldedText haystack = FoldForMatching(input);
    const auto& text = haystack.codePoints;
    auto overlapsOccupied = [&](std::size_t pos, std::size_t len) {
        for (const auto& m : occupied) {
            if (pos < m.pos + m.len && m.pos < pos + len) return true;
        }
        return false;
    };

    for (const auto& needle : needles) {
        auto from = text.begin();
        while (true) {
            auto hit = std::search(from, text.end(), needle.begin(), needle.end());
            if (hit == text.end()) break;
            auto first = static_cast<std::size_t>(hit - text.begin());
            auto last = first + needle.size();

            bool leftOk = first == 0 || !IsWordCodePoint(text[first - 1]);
            bool rightOk = last >= text.size() || !IsWordCodePoint(text[last]);
            std::size_t pos = haystack.offsets[first];
            std::size_t len = haystack.offsets[last] - pos;
            if (leftOk && rightOk && !overlapsOccupied(pos, len)) {
                out.push_back({pos, len, MatchKind::Custom});
            }
            from = hit + 1;
        }
    }
    return out;
}

std::vector<Redactor::Match> Redactor::chooseNonOverlapping(std::vector<Match> candidates) {
    std::sort(candidates.begin(), candidates.end(), [](const Match& a, const Match& b) {
        if (a.kind != b.kind) return static_cast<int>(a.kind) > static_cast<int>(b.kind);
        if (a.len != b.len) return a.len > b.len;
        return a.pos < b.pos;
    });

    std::vector<Match> chosen;
    for (const auto& m : candidates) {
        bool clash = std::any_of(chosen.begin(), chosen.end(), [&](const Match& c) {
            return m.pos < c.pos + c.len && c.pos < m.pos + m.len;
        });
        if (!clash) chosen.push_back(m);
    }

    std::sort(chosen.begin(), chosen.end(), [](const Match& a, const Match& b) { return a.pos < b.pos; });
    return chosen;
}

std::string Redactor::apply(const std::vector<Match>& matches, const std::string& input) {
    std::string out;
    out.reserve(input.size());
    std::size_t cursor = 0;
    for (const auto& m : matches) {
        if (m.pos < cursor) continue;
        out.append(input, cursor, m.pos - cursor);
        out += PlaceholderFor(m.kind);
        cursor = m.pos + m.len;
    }
    if (cursor < input.size()) out.append(input, cursor, std::string::npos);
    return out;
}

} // namespace reflectcore::domain::redaction
