#include "VocabItem.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace
{
    std::string trimmed(const std::string& s) {
        std::string t = s;
        while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
        while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
        return t;
    }
}

VocabItem::VocabItem(const std::string& t, const std::string& m, std::time_t createdAt)
    : term(t), meaning(m), created_at(createdAt), updated_at(createdAt)
{
    id = generateID();
    spdlog::info("Created VocabItem: ID={}, Term={}", id, term);
}

// Commas and line breaks are separators in the stored tag line
void VocabItem::addTag(const std::string& tag) {
    std::string t = tag;
    for (auto& c : t) {
        if (c == ',' || c == '\n' || c == '\r') c = ' ';
    }
    t = trimmed(t);
    if (t.empty()) return;

    if (!hasTag(t)) {
        tags.push_back(t);
        spdlog::debug("VocabItem ID={} addTag '{}'", id, t);
    }
}

bool VocabItem::removeTag(const std::string& tag) {
    auto it = std::find(tags.begin(), tags.end(), tag);
    if (it != tags.end()) {
        tags.erase(it);
        spdlog::debug("VocabItem ID={} removeTag '{}'", id, tag);
        return true;
    }
    return false;
}

bool VocabItem::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

void VocabItem::setTags(const std::vector<std::string>& newTags) {
    tags.clear();
    for (const auto& t : newTags) addTag(t);
    spdlog::debug("VocabItem ID={} setTags count={}", id, tags.size());
}

std::string VocabItem::tagsAsLine() const {
    std::ostringstream oss;
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i) oss << ",";
        oss << tags[i];
    }
    return oss.str();
}

std::vector<std::string> VocabItem::splitTagsLine(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string t;
    while (std::getline(iss, t, ',')) {
        t = trimmed(t);
        if (!t.empty() && std::find(out.begin(), out.end(), t) == out.end()) out.push_back(t);
    }
    return out;
}

// Unique ID generator (timestamp + random bits)
std::string VocabItem::generateID() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    std::random_device rd;
    std::mt19937_64 eng(rd());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}
