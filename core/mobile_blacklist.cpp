#include "mobile_blacklist.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <vector>

namespace rfnav {

namespace {

// Whole words of the lower-cased label
const std::unordered_set<std::string> k_words = {
    "android", "ipad", "phone", "motorola", "huawei", "iphone", // tethering
    "mobile",
    "deinbus", "ecolines", "eurolines", "fernbus", "flixbus", "muenchenlinie",
    "postbus", "skanetrafiken", "oresundstag", "regiojet", // transport
    "uconnect",  // Chrysler / Fiat, "Chrysler uconnect xxxxxx"
    "chevy",     // "Chevy Cruz 7774"
    "silverado", // GMC
    "myvolvo",
    "bmw",       // "BMW98303 CarPlay", "My BMW Hotspot 8303"
};

const std::vector<std::string> k_prefixes = {
    "moto ", "samsung galaxy", "lg aristo", "androidap", // tethering
    "cellspot", // T-Mobile portable cell based WiFi
    "verizon",  // Verizon hotspot
    "wifi hotspot ", // GM vehicles, "WiFi Hotspot 1234"
    "mb wlan ", "mb hotspot", // Mercedes
    "westbahn ", "buswifi", "coachamerica", "disneylandresortexpress",
    "taxilinq", "transitwirelesswifi",
    "yicarcam", // dashcam
    "my seat", "vw wlan", "my vw", "my skoda", "skoda_wlan",
};

const std::vector<std::string> k_suffixes = {
    "corvette",
    "truck",    // "Morgans Truck"
    "suburban",
    "terrain",
    "sierra",
    "gmc wifi",
};

const std::unordered_set<std::string> k_exact = {
    "amtrak", "amtrakconnect", "cdwifi", "megabus", "westlan", "wifi in de trein",
    "svciob", "oebb", "oebb-postbus", "dpmbfree", "telekom_ice", "db ic bus",
    "gkbguest",
};

bool starts_with(const std::string& s, const std::string& p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

bool ends_with(const std::string& s, const std::string& p) {
    return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
}

bool contains(const std::string& s, const char* p) {
    return s.find(p) != std::string::npos;
}

// Runs of a-z, in order
std::vector<std::string> split_words(const std::string& lc) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : lc) {
        if (c >= 'a' && c <= 'z') {
            cur.push_back(c);
        } else if (!cur.empty()) {
            words.push_back(cur);
            cur.clear();
        }
    }
    if (!cur.empty()) words.push_back(cur);
    return words;
}

// "aa:bb:cc:dd:ee:ff" -> "ddeeff"
std::string mac_suffix(const std::string& id) {
    if (id.size() < 8) return std::string();
    std::string tail = id.substr(id.size() - 8);
    std::string out;
    for (char c : tail) {
        if (c != ':') out.push_back((char)std::tolower((unsigned char)c));
    }
    return out;
}

bool ssid_blacklisted(const std::string& id, const std::string& label) {
    std::string lc = label;
    std::transform(lc.begin(), lc.end(), lc.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    const std::vector<std::string> words = split_words(lc);
    const std::unordered_set<std::string> word_set(words.begin(), words.end());
    auto has_word = [&](const char* w) { return word_set.count(w) != 0; };

    for (const auto& w : words) {
        if (k_words.count(w)) return true;
    }
    for (const auto& p : k_prefixes) {
        if (starts_with(lc, p)) return true;
    }
    for (const auto& s : k_suffixes) {
        if (ends_with(lc, s)) return true;
    }
    if (k_exact.count(lc)) return true;

    if (has_word("moto") && starts_with(label, "MOTO")) return true; // "MOTO9564"
    if (!words.empty() && words.front() == "audi") return true;
    // Vehicles often default to the last three address octets
    const std::string suffix = mac_suffix(id);
    if (!suffix.empty() && lc == suffix) return true;
    // Multi-word patterns the word split cannot see
    if (has_word("admin") && contains(lc, "admin@ms")) return true;
    if (has_word("guest") && contains(lc, "guest@ms")) return true;
    if (has_word("contiki") && contains(lc, "contiki-wifi")) return true;
    if (has_word("interakti") && contains(lc, "nsb_interakti")) return true;
    if (has_word("nvram") && contains(lc, "nvram warning")) return true;
    return false;
}

} // namespace

bool label_blacklisted(const Identity& identity, const std::string& label) {
    if (label.empty()) return false;
    if (!is_wlan(identity.type())) return false;
    return ssid_blacklisted(identity.id(), label);
}

} // namespace rfnav
