/**
 * @file replacement_generator.cpp
 * @brief Implementation of synthetic value generation
 */

#include "inkognito/anonymization/replacement_generator.hpp"

#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace inkognito::anonymization {

using core::entity_type;

namespace {

constexpr int kMaxGenerationAttempts = 32;

constexpr std::array<std::string_view, 40> kFirstNames{
    "James",   "Mary",    "Robert",  "Patricia", "Michael", "Linda",
    "William", "Barbara", "David",   "Susan",    "Richard", "Jessica",
    "Joseph",  "Sarah",   "Thomas",  "Karen",    "Charles", "Nancy",
    "Daniel",  "Lisa",    "Matthew", "Betty",    "Anthony", "Sandra",
    "Mark",    "Ashley",  "Steven",  "Dorothy",  "Andrew",  "Kimberly",
    "Paul",    "Emily",   "Joshua",  "Donna",    "Kenneth", "Michelle",
    "Kevin",   "Carol",   "Brian",   "Amanda"};

constexpr std::array<std::string_view, 40> kLastNames{
    "Anderson", "Bennett",  "Carter",   "Dawson",   "Ellison",  "Fletcher",
    "Garrison", "Holloway", "Ingram",   "Jennings", "Kendall",  "Lambert",
    "Maddox",   "Norwood",  "Osborne",  "Prescott", "Quinlan",  "Ramsey",
    "Sheridan", "Thornton", "Underwood", "Vaughn",  "Whitaker", "Yardley",
    "Ashford",  "Blackwell", "Calloway", "Donovan", "Everett",  "Fairbanks",
    "Gallagher", "Harrington", "Kensington", "Lockhart", "Merriweather",
    "Pemberton", "Rutherford", "Stanton", "Wakefield", "Winslow"};

constexpr std::array<std::string_view, 30> kCities{
    "Riverton",    "Lakewood",   "Fairview",   "Brookhaven", "Cedar Falls",
    "Maplewood",   "Oakridge",   "Pinecrest",  "Springdale", "Westbrook",
    "Ashland",     "Bridgeport", "Clearwater", "Dover",      "Elmhurst",
    "Franklin",    "Glenwood",   "Hillsboro",  "Kingsport",  "Lexington",
    "Milford",     "Newport",    "Oxford",     "Plainview",  "Rockford",
    "Salem",       "Trenton",    "Vernon",     "Weston",     "Yorktown"};

constexpr std::array<std::string_view, 12> kCompanySuffixes{
    "Group", "Holdings", "Partners", "Industries", "Solutions", "Systems",
    "Associates", "LLC", "Inc", "Ltd", "Consulting", "Enterprises"};

constexpr std::array<std::string_view, 10> kEmailDomains{
    "example.com", "example.org", "example.net", "mailbox.test",
    "inbox.test",  "post.test",   "webmail.test", "corp.test",
    "office.test", "contact.test"};

constexpr std::array<std::string_view, 20> kUrlWords{
    "blue",  "river", "summit", "cloud",  "harbor", "stone", "maple",
    "north", "bright", "silver", "pixel", "forge",  "orbit", "cedar",
    "delta", "echo",  "quartz", "lumen",  "vertex", "nova"};

constexpr std::array<std::string_view, 6> kUrlTlds{
    "com", "net", "org", "io", "info", "biz"};

constexpr std::array<std::string_view, 8> kUrlPaths{
    "", "about", "contact", "home", "index.html", "blog", "products", "team"};

constexpr std::string_view kHexDigits = "0123456789abcdef";

}  // namespace

replacement_generator::replacement_generator(std::optional<std::uint64_t> seed,
                                             std::shared_ptr<di::ILogger> logger)
    : seed_{seed.value_or(0)}
    , logger_{di::or_null(std::move(logger))} {
    if (!seed.has_value()) {
        std::random_device rd;
        seed_ = (static_cast<std::uint64_t>(rd()) << 32) | rd();
    }
    engine_.seed(seed_);
}

auto replacement_generator::generate(entity_type type,
                                     std::string_view original,
                                     mapping_table& table) -> Result<std::string> {
    if (original.empty()) {
        return inkognito_error<std::string>(error_codes::invalid_argument,
                                            "Original value must not be empty");
    }

    if (auto cached = table.get_synthetic(original)) {
        return *cached;
    }

    std::string synthetic;
    if (!has_dedicated_generator(type)) {
        logger_->info_fmt("No dedicated generator for {}, using generic token",
                          core::to_string(type));
        synthetic = fallback_value(type, table);
    } else {
        for (int attempt = 0; attempt < kMaxGenerationAttempts; ++attempt) {
            synthetic = synthesize(type);
            if (synthetic != original && !table.contains_synthetic(synthetic)) {
                break;
            }
            synthetic.clear();
        }
        if (synthetic.empty()) {
            // Small value spaces (e.g. city names) can run out within a batch
            synthetic = synthesize(type) + " " + std::to_string(table.size() + 1);
        }
    }

    auto add_result = table.add_mapping(original, synthetic);
    if (add_result.is_err()) {
        return Result<std::string>(add_result.error());
    }

    return synthetic;
}

auto replacement_generator::draw_date_offset(int window_days) -> std::int64_t {
    if (window_days < 0) {
        window_days = 0;
    }
    return uniform(-window_days, window_days);
}

auto replacement_generator::has_dedicated_generator(entity_type type) noexcept -> bool {
    return type != entity_type::unknown;
}

auto replacement_generator::seed() const noexcept -> std::uint64_t {
    return seed_;
}

auto replacement_generator::synthesize(entity_type type) -> std::string {
    switch (type) {
        case entity_type::person:
            return person_name();
        case entity_type::organization:
            return organization_name();
        case entity_type::location:
            return location_name();
        case entity_type::email_address:
            return email_address();
        case entity_type::phone_number:
            return phone_number();
        case entity_type::credit_card:
            return credit_card_number();
        case entity_type::us_ssn:
            return ssn();
        case entity_type::passport:
            return passport_number();
        case entity_type::driver_license:
            return driver_license_number();
        case entity_type::ip_address:
            return ipv4_address();
        case entity_type::date_time:
            return date_time_string();
        case entity_type::url:
            return web_url();
        case entity_type::bank_number:
            return bank_account();
        case entity_type::crypto:
            return crypto_address();
        case entity_type::medical_license:
            return medical_license_number();
        case entity_type::unknown:
            break;
    }
    return "REDACTED_" + std::string{core::to_string(type)};
}

auto replacement_generator::fallback_value(entity_type type,
                                           const mapping_table& table) const
    -> std::string {
    const std::string base = "REDACTED_" + std::string{core::to_string(type)};
    if (!table.contains_synthetic(base)) {
        return base;
    }

    // Distinct originals keep distinct tokens so the table stays invertible
    for (std::size_t n = 2;; ++n) {
        auto candidate = base + "_" + std::to_string(n);
        if (!table.contains_synthetic(candidate)) {
            return candidate;
        }
    }
}

// =============================================================================
// Type-specific generators
// =============================================================================

auto replacement_generator::person_name() -> std::string {
    std::string name{pick(kFirstNames)};
    name += ' ';
    name += pick(kLastNames);
    return name;
}

auto replacement_generator::organization_name() -> std::string {
    std::string name{pick(kLastNames)};
    if (uniform(0, 2) == 0) {
        name += " & ";
        name += pick(kLastNames);
    }
    name += ' ';
    name += pick(kCompanySuffixes);
    return name;
}

auto replacement_generator::location_name() -> std::string {
    return std::string{pick(kCities)};
}

auto replacement_generator::email_address() -> std::string {
    std::string local{pick(kFirstNames)};
    local += '.';
    local += pick(kLastNames);
    for (auto& c : local) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    local += std::to_string(uniform(1, 99));
    return local + "@" + std::string{pick(kEmailDomains)};
}

auto replacement_generator::phone_number() -> std::string {
    std::ostringstream oss;
    oss << '(' << uniform(201, 989) << ") " << uniform(200, 999) << '-'
        << std::setw(4) << std::setfill('0') << uniform(0, 9999);
    return oss.str();
}

auto replacement_generator::credit_card_number() -> std::string {
    // 16 digits starting with 4, last digit is the Luhn check digit
    std::string number = "4" + digits(14);

    int sum = 0;
    for (std::size_t i = 0; i < number.size(); ++i) {
        int digit = number[number.size() - 1 - i] - '0';
        if (i % 2 == 0) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
    }
    number += static_cast<char>('0' + (10 - sum % 10) % 10);
    return number;
}

auto replacement_generator::ssn() -> std::string {
    int area = uniform(100, 665);
    std::ostringstream oss;
    oss << area << '-' << std::setw(2) << std::setfill('0') << uniform(1, 99)
        << '-' << std::setw(4) << std::setfill('0') << uniform(1, 9999);
    return oss.str();
}

auto replacement_generator::passport_number() -> std::string {
    return letters(2) + digits(7);
}

auto replacement_generator::driver_license_number() -> std::string {
    return "DL-" + digits(8);
}

auto replacement_generator::ipv4_address() -> std::string {
    int first = uniform(11, 223);
    if (first == 127) {
        first = 128;
    }
    std::ostringstream oss;
    oss << first << '.' << uniform(0, 255) << '.' << uniform(0, 255) << '.'
        << uniform(1, 254);
    return oss.str();
}

auto replacement_generator::date_time_string() -> std::string {
    std::ostringstream oss;
    oss << std::setfill('0') << uniform(1970, 2024) << '-' << std::setw(2)
        << uniform(1, 12) << '-' << std::setw(2) << uniform(1, 28) << 'T'
        << std::setw(2) << uniform(0, 23) << ':' << std::setw(2) << uniform(0, 59)
        << ':' << std::setw(2) << uniform(0, 59);
    return oss.str();
}

auto replacement_generator::web_url() -> std::string {
    std::string url = "https://www.";
    url += pick(kUrlWords);
    url += pick(kUrlWords);
    url += '.';
    url += pick(kUrlTlds);
    url += '/';
    url += pick(kUrlPaths);
    return url;
}

auto replacement_generator::bank_account() -> std::string {
    return letters(4) + digits(14);
}

auto replacement_generator::crypto_address() -> std::string {
    std::string address = "0x";
    for (int i = 0; i < 40; ++i) {
        address += kHexDigits[static_cast<std::size_t>(uniform(0, 15))];
    }
    return address;
}

auto replacement_generator::medical_license_number() -> std::string {
    return "MD-" + digits(7);
}

// =============================================================================
// Primitives
// =============================================================================

auto replacement_generator::uniform(int low, int high) -> int {
    std::uniform_int_distribution<int> dist(low, high);
    return dist(engine_);
}

auto replacement_generator::digits(std::size_t count) -> std::string {
    std::string result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        result += static_cast<char>('0' + uniform(0, 9));
    }
    return result;
}

auto replacement_generator::letters(std::size_t count) -> std::string {
    std::string result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        result += static_cast<char>('A' + uniform(0, 25));
    }
    return result;
}

}  // namespace inkognito::anonymization
