/**
 * @file pattern_detector_test.cpp
 * @brief Unit tests for the regular-expression detector
 */

#include <inkognito/anonymization/pattern_detector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace inkognito;
using namespace inkognito::anonymization;
using core::entity_type;

namespace {

auto scan_values(pattern_detector& detector, std::string_view text)
    -> std::vector<detection> {
    auto result = detector.scan(text);
    REQUIRE(result.is_ok());
    return result.value();
}

auto has(const std::vector<detection>& found, entity_type type, std::string_view value)
    -> bool {
    return std::any_of(found.begin(), found.end(), [&](const detection& d) {
        return d.type == type && d.value == value;
    });
}

}  // namespace

TEST_CASE("pattern_detector: structured values", "[anonymization][pattern_detector]") {
    pattern_detector detector;

    SECTION("Email address") {
        auto found = scan_values(detector, "Contact john.smith@example.com today.");
        REQUIRE(found.size() == 1);
        CHECK(found[0].type == entity_type::email_address);
        CHECK(found[0].value == "john.smith@example.com");
        CHECK(found[0].confidence == pattern_detector::match_confidence);
    }

    SECTION("URL without trailing punctuation") {
        auto found = scan_values(detector, "See https://intranet.acme.io/wiki/page.");
        CHECK(has(found, entity_type::url, "https://intranet.acme.io/wiki/page"));
    }

    SECTION("IPv4 address") {
        auto found = scan_values(detector, "Server at 10.20.30.40 is down");
        CHECK(has(found, entity_type::ip_address, "10.20.30.40"));
    }

    SECTION("Social security number") {
        auto found = scan_values(detector, "SSN: 123-45-6789");
        CHECK(has(found, entity_type::us_ssn, "123-45-6789"));
    }

    SECTION("Card number must pass the Luhn check") {
        auto valid = scan_values(detector, "Card 4111 1111 1111 1111 on file");
        CHECK(has(valid, entity_type::credit_card, "4111 1111 1111 1111"));

        auto invalid = scan_values(detector, "Card 4111 1111 1111 1112 on file");
        CHECK_FALSE(has(invalid, entity_type::credit_card, "4111 1111 1111 1112"));
    }

    SECTION("Phone number") {
        auto found = scan_values(detector, "Call (555) 123-4567 now");
        CHECK(has(found, entity_type::phone_number, "(555) 123-4567"));
    }

    SECTION("ISO date") {
        auto found = scan_values(detector, "Signed on 2023-04-01 by both parties");
        CHECK(has(found, entity_type::date_time, "2023-04-01"));
    }

    SECTION("Wallet address") {
        const std::string wallet = "0x52908400098527886E0F7030069857D2E4169EE7";
        auto found = scan_values(detector, "Send to " + wallet);
        CHECK(has(found, entity_type::crypto, wallet));
    }
}

TEST_CASE("pattern_detector: overlapping matches", "[anonymization][pattern_detector]") {
    pattern_detector detector;

    SECTION("Longest match at a position wins") {
        auto found = scan_values(detector, "Visit https://example.com/contact now");
        REQUIRE(found.size() == 1);
        CHECK(found[0].type == entity_type::url);
    }

    SECTION("Results never overlap") {
        auto found = scan_values(detector, "mail bob@corp.example.org or call 555-123-4567");
        CHECK(has(found, entity_type::email_address, "bob@corp.example.org"));
        CHECK(has(found, entity_type::phone_number, "555-123-4567"));
        CHECK(found.size() == 2);
    }
}

TEST_CASE("pattern_detector: allow-list restricts patterns",
          "[anonymization][pattern_detector]") {
    pattern_detector detector({entity_type::email_address});
    auto found = scan_values(detector, "a@b.org from 10.0.0.1 on 2023-01-01");
    REQUIRE(found.size() == 1);
    CHECK(found[0].type == entity_type::email_address);
}

TEST_CASE("pattern_detector: plain text has no detections",
          "[anonymization][pattern_detector]") {
    pattern_detector detector;
    CHECK(scan_values(detector, "Nothing sensitive in this sentence.").empty());
    CHECK(scan_values(detector, "").empty());

    auto supported = pattern_detector::supported_types();
    CHECK(std::find(supported.begin(), supported.end(), entity_type::person) ==
          supported.end());
}

TEST_CASE("pattern_detector: long unbroken runs", "[anonymization][pattern_detector]") {
    pattern_detector detector;

    SECTION("Embedded base64 image is skipped and the rest still scanned") {
        std::string text = "Mail john@x.com first.\n![img](data:image/png;base64," +
                           std::string(100000, 'A') +
                           ")\nThen visit https://www.example.org/docs today.";
        auto found = scan_values(detector, text);
        CHECK(has(found, entity_type::email_address, "john@x.com"));
        CHECK(has(found, entity_type::url, "https://www.example.org/docs"));
        REQUIRE(found.size() == 2);
    }

    SECTION("Oversized URL yields no detection") {
        std::string text = "https://example.com/" + std::string(200000, 'a');
        auto found = scan_values(detector, text);
        CHECK(found.empty());
    }

    SECTION("Local part run at the token limit does not match an email") {
        std::string text = std::string(4000, 'A') + " plain words";
        auto found = scan_values(detector, text);
        CHECK(found.empty());
    }
}
