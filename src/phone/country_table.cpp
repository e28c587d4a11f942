#include "phone/country_table.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

#include "common/logger.h"

namespace phonenorm {
namespace phone {

namespace {

struct CodeEntry {
    const char* code;
    const char* iso;
};

// Calling code -> canonical ISO country
const CodeEntry CODE_TO_ISO[] = {
    {"1", "US"},        // shared with CA and the rest of NANP
    {"7", "RU"},
    {"33", "FR"},
    {"34", "ES"},
    {"39", "IT"},
    {"44", "GB"},
    {"49", "DE"},
    {"52", "MX"},
    {"55", "BR"},
    {"60", "MY"},
    {"61", "AU"},
    {"62", "ID"},
    {"63", "PH"},
    {"64", "NZ"},
    {"65", "SG"},
    {"66", "TH"},
    {"81", "JP"},
    {"82", "KR"},
    {"84", "VN"},
    {"86", "CN"},
    {"91", "IN"},
    {"852", "HK"},
    {"853", "MO"},
    {"886", "TW"},
};

// ISO countries that share a calling code with a canonical entry above
const CodeEntry EXTRA_ISO_TO_CODE[] = {
    {"1", "CA"},
};

// Codes accepted as plausible even without an ISO mapping
const char* const KNOWN_CODES[] = {
    "1",  "7",  "33", "34", "39", "44", "49", "52",  "55",  "60",  "61", "62",
    "63", "64", "65", "66", "81", "82", "84", "86",  "91",  "852", "853", "886",
};

// National numbers are dialed with a leading trunk '0'
const char* const TRUNK_ZERO_COUNTRIES[] = {
    "VN", "GB", "DE", "FR", "IT", "TH", "MY", "ID", "JP", "KR",
};

struct Tables {
    std::unordered_map<std::string, std::string> code_to_iso;
    std::unordered_map<std::string, std::string> iso_to_code;
    std::unordered_set<std::string> known_codes;
    std::unordered_set<std::string> trunk_zero;
};

bool isCallingCodeShape(const std::string& code) {
    if (code.empty() || code.length() > CountryTable::MAX_CODE_LENGTH) {
        return false;
    }
    return std::all_of(code.begin(), code.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

void verify(const Tables& t) {
    for (const auto& code : t.known_codes) {
        if (!isCallingCodeShape(code)) {
            LOG_FATAL("Country table: malformed calling code '{}'", code);
        }
    }
    for (const auto& [code, iso] : t.code_to_iso) {
        if (t.known_codes.count(code) == 0) {
            LOG_FATAL("Country table: mapped code {} ({}) missing from known codes", code, iso);
        }
    }
    for (const auto& [iso, code] : t.iso_to_code) {
        if (t.known_codes.count(code) == 0) {
            LOG_FATAL("Country table: {} maps to unknown code {}", iso, code);
        }
    }
    for (const auto& iso : t.trunk_zero) {
        if (t.iso_to_code.count(iso) == 0) {
            LOG_FATAL("Country table: trunk-zero country {} has no calling code", iso);
        }
    }
}

Tables buildTables() {
    Tables t;
    for (const auto& entry : CODE_TO_ISO) {
        t.code_to_iso.emplace(entry.code, entry.iso);
        t.iso_to_code.emplace(entry.iso, entry.code);
    }
    for (const auto& entry : EXTRA_ISO_TO_CODE) {
        t.iso_to_code.emplace(entry.iso, entry.code);
    }
    for (const char* code : KNOWN_CODES) {
        t.known_codes.emplace(code);
    }
    for (const char* iso : TRUNK_ZERO_COUNTRIES) {
        t.trunk_zero.emplace(iso);
    }

    verify(t);
    LOG_TRACE("Country table loaded: {} codes, {} countries", t.known_codes.size(),
              t.iso_to_code.size());
    return t;
}

const Tables& tables() {
    static const Tables instance = buildTables();
    return instance;
}

}  // namespace

std::optional<std::string> CountryTable::codeToIso(const std::string& code) {
    const auto& map = tables().code_to_iso;
    auto it = map.find(code);
    if (it == map.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> CountryTable::isoToCode(const std::string& iso) {
    const auto& map = tables().iso_to_code;
    auto it = map.find(iso);
    if (it == map.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CountryTable::isKnownCode(const std::string& code) {
    return tables().known_codes.count(code) > 0;
}

bool CountryTable::isTrunkZeroCountry(const std::string& iso) {
    return tables().trunk_zero.count(iso) > 0;
}

std::vector<std::string> CountryTable::knownCodes() {
    const auto& known = tables().known_codes;
    std::vector<std::string> codes(known.begin(), known.end());
    std::sort(codes.begin(), codes.end());
    return codes;
}

std::vector<std::string> CountryTable::isoCountries() {
    std::vector<std::string> countries;
    countries.reserve(tables().iso_to_code.size());
    for (const auto& entry : tables().iso_to_code) {
        countries.push_back(entry.first);
    }
    std::sort(countries.begin(), countries.end());
    return countries;
}

}  // namespace phone
}  // namespace phonenorm
