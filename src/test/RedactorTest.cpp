#undef NDEBUG
#include <cassert>
#include <iostream>

#include "domain/Fingerprint.hpp"
#include "domain/redaction/Redactor.hpp"

using namespace reflectcore::domain;
using namespace reflectcore::domain::redaction;

int main() {
    std::cout << "[Test] Starting Redactor Test..." << std::endl;

    Redactor redactor;

    // Same input and dictionary give the same output and hash.
    {
        RedactionDictionary dict;
        dict.tokens = {"555-1234"};
        auto a = redactor.redact("call 555-1234", dict);
        auto b = redactor.redact("call 555-1234", dict);
        assert(a.redactedText == b.redactedText);
        assert(a.inputHash == b.inputHash);
        assert(a.redactedText == "call [CUSTOM]");
        assert(a.inputHash == Fingerprint("call 555-1234"));
        assert(a.inputHash.size() == 16);
        assert(a.didRedact);
        std::cout << "[PASS] Deterministic custom token" << std::endl;
    }

    // Known FNV-1a 64 vectors.
    {
        assert(Fingerprint("") == "cbf29ce484222325");
        assert(Fingerprint("a") == "af63dc4c8601ec8c");
        std::cout << "[PASS] Fingerprint vectors" << std::endl;
    }

    // Structural matches.
    {
        RedactionDictionary empty;
        auto email = redactor.redact("mail me at jane.doe@example.com please", empty);
        assert(email.redactedText == "mail me at [EMAIL] please");

        auto card = redactor.redact("card 4111 1111 1111 1111", empty);
        assert(card.redactedText == "card [CARD]");

        auto clean = redactor.redact("nothing to hide here", empty);
        assert(clean.redactedText == "nothing to hide here");
        assert(!clean.didRedact);
        std::cout << "[PASS] Structural patterns" << std::endl;
    }

    // One sentence per detector.
    {
        RedactionDictionary empty;
        auto check = [&](const std::string& in, const std::string& expected) {
            auto r = redactor.redact(in, empty);
            if (r.redactedText != expected) {
                std::cerr << "[Test] Got: " << r.redactedText << std::endl;
            }
            assert(r.redactedText == expected);
        };

        check("ring me on +44 20 7946 0958 today", "ring me on [PHONE] today");
        check("call 07700 900123", "call [PHONE]");
        check("IBAN GB82WEST12345698765432.", "IBAN [IBAN].");
        check("My IBAN is GB82 WEST 1234 5698 7654 32.", "My IBAN is [IBAN].");
        check("I live at SW1A 1AA now", "I live at [POSTCODE] now");
        check("sort code: 12-34-56", "sort code: [SORTCODE]");
        check("use 12 34 56 for it", "use [SORTCODE] for it");
        check("account number 12345678", "account number [ACCOUNT]");
        check("my NI number is AB123456C.", "my NI number is [NINO].");
        check("my UTR is 1234567890", "my UTR is [UTR]");
        check("VAT number: 123456789", "VAT number: [VAT]");
        check("BIC: NWBKGB2L", "BIC: [BIC]");
        check("card 4111 1111 1111 1112", "card [CARD?]");
        std::cout << "[PASS] Every detector" << std::endl;
    }

    // Near misses stay as written.
    {
        RedactionDictionary empty;
        // QQ is never issued as a national insurance prefix.
        assert(redactor.redact("ref QQ123456C", empty).redactedText == "ref QQ123456C");
        // Without card words a failed checksum is just a number.
        assert(redactor.redact("ref 4111 1111 1111 1112", empty).redactedText == "ref 4111 1111 1111 1112");
        // A labelled BIC must have the 8 or 11 character shape.
        assert(redactor.redact("BIC: NWBK", empty).redactedText == "BIC: NWBK");
        std::cout << "[PASS] Near misses" << std::endl;
    }

    // Overlapping candidates collapse into the higher-priority placeholder.
    {
        RedactionDictionary empty;
        auto r = redactor.redact("account 12 34 56 78", empty);
        assert(r.redactedText == "account [ACCOUNT]");
        std::cout << "[PASS] Overlap resolution" << std::endl;
    }

    // Very long unbroken runs are scanned without exhausting the stack.
    {
        RedactionDictionary empty;
        std::string blob(100000, 'a');
        assert(redactor.redact(blob, empty).redactedText == blob);

        std::string digits = "account number " + std::string(40000, '7');
        assert(redactor.redact(digits, empty).redactedText == digits);

        std::string spaced;
        for (int i = 0; i < 30000; ++i) spaced += "1 ";
        assert(redactor.redact(spaced, empty).redactedText == spaced);

        auto tail = redactor.redact(blob + " write to jane@example.com", empty);
        assert(tail.redactedText == blob + " write to [EMAIL]");

        // An address sitting across a scan boundary is still found whole.
        std::string commas;
        for (int i = 0; i < 680; ++i) commas += "ab,";
        auto straddle = redactor.redact(commas + "jane.doe@example.com", empty);
        assert(straddle.redactedText == commas + "[EMAIL]");
        std::cout << "[PASS] Long input" << std::endl;
    }

    // Dictionary tokens fold case beyond ASCII.
    {
        RedactionDictionary dict;
        dict.tokens = {"Zo\xC3\xAB"};
        std::string text = std::string("ZO\xC3\x8B") + " and zo\xC3\xAB" + " met Zoe and Zo\xC3\xAB" + "lle";
        auto r = redactor.redact(text, dict);
        assert(r.redactedText == std::string("[CUSTOM] and [CUSTOM] met Zoe and Zo\xC3\xAB") + "lle");

        RedactionDictionary ascii;
        ascii.tokens = {"Acme"};
        assert(redactor.redact("ACME and acme", ascii).redactedText == "[CUSTOM] and [CUSTOM]");
        std::cout << "[PASS] Unicode case folding" << std::endl;
    }

    // Dictionary tokens: longest first, case-insensitive, whole tokens only.
    {
        RedactionDictionary dict;
        dict.tokens = {"acme", "Acme Corp", "ann"};
        auto r = redactor.redact("ACME CORP annual report by Ann", dict);
        assert(r.redactedText == "[CUSTOM] annual report by [CUSTOM]");

        RedactionDictionary reordered;
        reordered.tokens = {"ann", "Acme Corp", "acme"};
        assert(redactor.redact("ACME CORP annual report by Ann", reordered).redactedText == r.redactedText);

        RedactionDictionary blank;
        blank.tokens = {"   ", ""};
        assert(redactor.redact("keep me", blank).redactedText == "keep me");
        std::cout << "[PASS] Dictionary tokens" << std::endl;
    }

    // A dictionary token never splits a structural match.
    {
        RedactionDictionary dict;
        dict.tokens = {"example"};
        auto r = redactor.redact("write to bob@example.com", dict);
        assert(r.redactedText == "write to [EMAIL]");
        std::cout << "[PASS] Structural before custom" << std::endl;
    }

    std::cout << "[Test] Redactor Test PASSED" << std::endl;
    return 0;
}
