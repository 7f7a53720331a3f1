#include "Storage.hpp"
#include <fstream>
#include <iomanip>
#include <iterator>
#include <utility>
#include <sstream>
#include <cstring>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "ULXDAT1\n";
static const char RECORD_END[] = "---";

namespace
{
    std::string singleLine(const std::string& s) {
        std::string out = s;
        for (auto& c : out) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        return out;
    }

    std::string tagsField(const std::vector<std::string>& tags) {
        std::string out;
        for (const auto& t : tags) {
            std::string clean = singleLine(t);
            for (auto& c : clean) {
                if (c == ',') c = ' ';
            }
            if (!out.empty()) out += ",";
            out += clean;
        }
        return out;
    }

    // Keeps order and repeats; a session may drill the same item twice
    std::vector<std::string> splitIds(const std::string& line) {
        std::vector<std::string> out;
        std::istringstream iss(line);
        std::string id;
        while (std::getline(iss, id, ',')) {
            if (!id.empty()) out.push_back(id);
        }
        return out;
    }

    std::string optTime(const std::optional<std::time_t>& t) {
        return t ? std::to_string(static_cast<long long>(*t)) : std::string("-");
    }

    bool readOptTime(std::istream& in, std::optional<std::time_t>& out) {
        std::string tok;
        if (!(in >> tok)) return false;
        if (tok == "-") {
            out.reset();
            return true;
        }
        try {
            out = static_cast<std::time_t>(std::stoll(tok));
        }
        catch (const std::exception&) {
            return false;
        }
        return true;
    }

    void writeSkill(std::ostream& out, const SkillCounters& s) {
        out << " " << s.correct_count << " " << s.incorrect_count << " " << optTime(s.last_attempt_at);
    }

    bool readSkill(std::istream& in, SkillCounters& s) {
        return (in >> s.correct_count >> s.incorrect_count) && readOptTime(in, s.last_attempt_at);
    }

    // Skips the remainder of the record up to and including the "---" line
    bool skipToRecordEnd(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            if (line == RECORD_END) return true;
        }
        return false;
    }
}

std::string Storage::serializeItems(const std::vector<VocabItem>& items) {
    std::ostringstream oss;
    oss << std::setprecision(12);

    for (const auto& it : items) {
        if (it.id.empty()) {
            spdlog::warn("Skipping item '{}' without an id", it.term);
            continue;
        }
        oss << singleLine(it.id) << "\n"
            << singleLine(it.term) << "\n"
            << singleLine(it.meaning) << "\n"
            << tagsField(it.tags) << "\n"
            << static_cast<long long>(it.created_at) << " "
            << static_cast<long long>(it.updated_at) << "\n";

        if (it.schedule) {
            const auto& s = *it.schedule;
            oss << "S " << (s.algorithm.empty() ? "sm2" : s.algorithm) << " "
                << s.streak << " "
                << s.interval_hours << " "
                << s.ease_factor << " "
                << static_cast<long long>(s.due_at) << " "
                << optTime(s.last_reviewed_at) << "\n";
        }
        else {
            oss << "S -\n";
        }

        if (it.performance) {
            oss << "P";
            writeSkill(oss, it.performance->recognition);
            writeSkill(oss, it.performance->production);
            oss << "\n";
        }
        else {
            oss << "P -\n";
        }

        oss << RECORD_END << "\n";
    }

    return oss.str();
}

bool Storage::parseItems(const std::string& plain, std::vector<VocabItem>& items) {
    std::istringstream iss(plain);
    items.clear();

    while (true) {
        VocabItem it;
        if (!std::getline(iss, it.id)) break;
        if (it.id.empty()) continue;
        if (!std::getline(iss, it.term)) return false;
        if (!std::getline(iss, it.meaning)) return false;

        std::string tags_line;
        if (!std::getline(iss, tags_line)) return false;
        it.setTags(VocabItem::splitTagsLine(tags_line));

        long long created = 0, updated = 0;
        if (!(iss >> created >> updated)) return false;
        it.created_at = static_cast<std::time_t>(created);
        it.updated_at = static_cast<std::time_t>(updated);

        std::string tag;
        if (!(iss >> tag) || tag != "S") return false;
        std::string algorithm;
        if (!(iss >> algorithm)) return false;
        if (algorithm != "-") {
            ScheduleState s;
            s.algorithm = algorithm;
            long long due = 0;
            if (!(iss >> s.streak >> s.interval_hours >> s.ease_factor >> due)) return false;
            s.due_at = static_cast<std::time_t>(due);
            if (!readOptTime(iss, s.last_reviewed_at)) return false;
            it.schedule = s;
        }

        if (!(iss >> tag) || tag != "P") return false;
        std::string first;
        if (!(iss >> first)) return false;
        if (first != "-") {
            PerformanceCounters p;
            std::istringstream rest(first);
            if (!(rest >> p.recognition.correct_count)) return false;
            if (!(iss >> p.recognition.incorrect_count) || !readOptTime(iss, p.recognition.last_attempt_at)) return false;
            if (!readSkill(iss, p.production)) return false;
            it.performance = p;
        }

        if (!skipToRecordEnd(iss)) return false;
        items.push_back(std::move(it));
    }

    return true;
}

std::string Storage::serializeSessions(const std::vector<DrillSession>& sessions) {
    std::ostringstream oss;
    oss << std::setprecision(12);

    for (const auto& s : sessions) {
        oss << singleLine(s.id) << "\n";
        for (size_t i = 0; i < s.vocab_item_ids.size(); ++i) {
            if (i) oss << ",";
            oss << singleLine(s.vocab_item_ids[i]);
        }
        oss << "\n"
            << static_cast<long long>(s.started_at) << " "
            << static_cast<long long>(s.ended_at) << " "
            << s.score << " "
            << s.correct_count << " "
            << s.incorrect_count << "\n"
            << RECORD_END << "\n";
    }

    return oss.str();
}

bool Storage::parseSessions(const std::string& plain, std::vector<DrillSession>& sessions) {
    std::istringstream iss(plain);
    sessions.clear();

    while (true) {
        DrillSession s;
        if (!std::getline(iss, s.id)) break;
        if (s.id.empty()) continue;

        std::string ids_line;
        if (!std::getline(iss, ids_line)) return false;
        s.vocab_item_ids = splitIds(ids_line);

        long long started = 0, ended = 0;
        if (!(iss >> started >> ended >> s.score >> s.correct_count >> s.incorrect_count)) return false;
        s.started_at = static_cast<std::time_t>(started);
        s.ended_at = static_cast<std::time_t>(ended);

        if (!skipToRecordEnd(iss)) return false;
        sessions.push_back(std::move(s));
    }

    return true;
}

bool Storage::writeEncrypted(const std::string& plain, const std::string& filename, const std::vector<unsigned char>& key) {
    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data()) != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for encrypted write", filename);
        return false;
    }

    out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    if (!out) {
        spdlog::error("Short write to '{}'", filename);
        return false;
    }
    return true;
}

bool Storage::readEncrypted(std::string& plain, bool& found, const std::string& filename, const std::vector<unsigned char>& key) {
    plain.clear();
    found = false;

    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        return true;
    }
    found = true;

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header in '{}'", filename);
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> decrypted(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(decrypted.data(), ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption failed for '{}' (wrong passphrase or corrupt file)", filename);
        return false;
    }

    plain.assign(reinterpret_cast<const char*>(decrypted.data()), decrypted.size());
    sodium_memzero(decrypted.data(), decrypted.size());
    return true;
}

bool Storage::saveItems(const std::vector<VocabItem>& items, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::info("Saving {} encrypted items to '{}'", items.size(), filename);
    return writeEncrypted(serializeItems(items), filename, key);
}

bool Storage::loadItems(std::vector<VocabItem>& items, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::info("Loading encrypted items from '{}'", filename);
    items.clear();

    std::string plain;
    bool found = false;
    if (!readEncrypted(plain, found, filename, key)) return false;
    if (!found) {
        spdlog::warn("Item file '{}' not found; treating as empty", filename);
        return true;
    }

    if (!parseItems(plain, items)) {
        spdlog::error("Malformed item records in '{}'", filename);
        items.clear();
        return false;
    }

    spdlog::info("Loaded {} items", items.size());
    return true;
}

bool Storage::saveSessions(const std::vector<DrillSession>& sessions, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::info("Saving {} sessions to '{}'", sessions.size(), filename);
    return writeEncrypted(serializeSessions(sessions), filename, key);
}

bool Storage::loadSessions(std::vector<DrillSession>& sessions, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::info("Loading sessions from '{}'", filename);
    sessions.clear();

    std::string plain;
    bool found = false;
    if (!readEncrypted(plain, found, filename, key)) return false;
    if (!found) {
        spdlog::warn("Session file '{}' not found; treating as empty", filename);
        return true;
    }

    if (!parseSessions(plain, sessions)) {
        spdlog::error("Malformed session records in '{}'", filename);
        sessions.clear();
        return false;
    }

    spdlog::info("Loaded {} sessions", sessions.size());
    return true;
}
