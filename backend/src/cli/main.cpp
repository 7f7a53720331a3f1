#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

#include "../utils/logging.hpp"
#include "../config/Config.hpp"
#include "../storage/FileRepository.hpp"
#include "../storage/Vault.hpp"
#include "../core/Mastery.hpp"
#include "../core/OutcomeClassifier.hpp"
#include "../core/ProgressAggregator.hpp"
#include "../core/QueueBuilder.hpp"
#include "../core/TimeUtils.hpp"

namespace
{
    std::string lowerTrimmed(std::string s) {
        while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
        while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    int askInt(const std::string& prompt, int lo, int hi) {
        while (true) {
            std::cout << prompt;
            int v;
            if (std::cin >> v && v >= lo && v <= hi) {
                std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
                return v;
            }
            if (std::cin.eof()) return lo;
            std::cin.clear();
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            std::cout << "Invalid input.\n";
        }
    }

    std::string formatOptional(const std::optional<double>& v, int precision = 2) {
        if (!v) return "n/a";
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << *v;
        return oss.str();
    }

    void listAllWords(const std::vector<VocabItem>& items, std::time_t now) {
        std::cout << "\n===== ALL WORDS =====\n";

        if (items.empty()) {
            std::cout << "No words stored.\n";
            return;
        }

        for (size_t i = 0; i < items.size(); i++) {
            const VocabItem& it = items[i];
            const auto summary = Mastery::performanceSummary(it, now);

            std::cout << i + 1 << ". " << it.term << " - " << it.meaning << "\n";
            std::cout << "   Tags: " << (it.tags.empty() ? "(none)" : it.tagsAsLine()) << "\n";

            if (it.schedule) {
                std::cout << "   Interval: " << it.schedule->interval_hours << " h\n";
                std::cout << "   Ease: " << it.schedule->ease_factor << "\n";
                std::cout << "   Due: " << TimeUtils::toIso(it.schedule->due_at)
                    << " (" << formatOptional(summary.overall.days_until_due, 1) << " days)\n";
            }
            else {
                std::cout << "   Not reviewed yet\n";
            }

            std::cout << "   Streak: " << summary.overall.streak << "\n";
            std::cout << "   Recognition: " << summary.recognition.correct << "/" << summary.recognition.total
                << "  Production: " << summary.production.correct << "/" << summary.production.total << "\n";
            std::cout << "   Mastery: " << formatOptional(summary.overall.mastery)
                << (summary.overall.is_mastered ? " (mastered)" : "") << "\n";
            std::cout << "-----------------------------\n";
        }
    }

    ActivityOutcome runDrill(const VocabItem& item, const QualityPolicy& policy) {
        ActivityOutcome outcome;

        std::cout << "\nWord: " << item.term << "\n";
        int mode = askInt(" 1 = Recognition (flip card)\n 2 = Production (type the meaning)\n> ", 1, 2);

        if (mode == 1) {
            outcome.activity_type = ActivityType::Recognition;
            std::cout << "Meaning: " << item.meaning << "\n";
            outcome.was_correct = askInt("Did you know it? 1 = yes, 0 = no\n> ", 0, 1) == 1;
        }
        else {
            outcome.activity_type = ActivityType::Production;
            std::cout << "Type the meaning: ";
            std::string answer;
            std::getline(std::cin, answer);

            if (lowerTrimmed(answer) == lowerTrimmed(item.meaning)) {
                outcome.score = 1.0;
                outcome.was_correct = true;
                std::cout << "Exact match.\n";
            }
            else {
                std::cout << "Expected: " << item.meaning << "\n";
                int self = askInt("Rate your answer 0-10\n> ", 0, 10);
                outcome.score = self / 10.0;
                outcome.was_correct = *outcome.score >= policy.pass_threshold;
            }
        }

        outcome.attempted_at = std::time(nullptr);
        return outcome;
    }

    void practice(FileRepository& repo, const OutcomeClassifier& classifier, const EngineConfig& cfg) {
        const std::vector<VocabItem> items = repo.listAll();
        const std::time_t startedAt = std::time(nullptr);

        QueueBuilder builder(cfg.upcoming_window_hours);
        PracticeQueue pq = builder.build(items, startedAt, cfg.queue_limit);

        std::cout << pq.due_count << " due, " << pq.upcoming_count << " upcoming, "
            << pq.new_count << " new\n";
        if (pq.queue.empty()) {
            std::cout << "Nothing to practice.\n";
            return;
        }

        DrillSession session;
        session.id = VocabItem::generateID();
        session.started_at = startedAt;

        for (const VocabItem* item : pq.queue) {
            ActivityOutcome outcome = runDrill(*item, classifier.policy());
            OutcomeUpdate update = classifier.applyOutcome(*item, outcome);

            if (!repo.updateSchedule(item->id, update.schedule, update.performance)) {
                std::cout << "Could not update word.\n";
                continue;
            }

            session.vocab_item_ids.push_back(item->id);
            if (outcome.was_correct) session.correct_count++;
            else session.incorrect_count++;

            std::cout << (update.was_successful ? "Next review in " : "Again in ")
                << update.schedule.interval_hours << " h\n";

            if (askInt("Continue? 1 = yes, 0 = stop\n> ", 0, 1) == 0) break;
        }

        session.ended_at = std::time(nullptr);
        session.score = session.accuracy().value_or(0.0);
        repo.append(session);

        spdlog::info("Practice session {} finished: {} correct, {} incorrect",
            session.id, session.correct_count, session.incorrect_count);
    }

    void dashboard(const FileRepository& repo, const EngineConfig& cfg) {
        const std::time_t now = std::time(nullptr);
        const auto items = repo.listAll();
        const auto sessions = repo.listAllSessions();

        ProgressAggregator agg(cfg.learned_streak_threshold, cfg.utc_offset_minutes);
        ProgressStats stats = agg.aggregate(items, sessions, now);

        std::cout << "\n===== PROGRESS =====\n"
            << "Words: " << stats.total_vocab_count << "\n"
            << "Learned: " << stats.learned_vocab_count << "\n"
            << "Due now: " << stats.review_due_count << "\n"
            << "Streak: " << stats.streak_days << " day(s)\n"
            << "Last session: " << (stats.last_session_at ? TimeUtils::toIso(*stats.last_session_at) : "never") << "\n";

        WeeklyActivity week = agg.weeklyActivity(sessions, now);
        std::cout << "\nThis week (" << week.total_minutes << " min):\n";
        for (const auto& p : week.points) {
            std::cout << "  " << p.label << " " << p.minutes << " min\n";
        }

        auto weak = ProgressAggregator::weakItems(items, cfg.weak_item_limit);
        std::cout << "\nWeakest words:\n";
        if (weak.empty()) std::cout << "  No weak vocabulary identified yet.\n";
        for (const VocabItem* w : weak) {
            std::cout << "  - " << w->term << " (streak " << (w->schedule ? w->schedule->streak : 0) << ")\n";
        }
    }
}

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    EngineConfig cfg;
    try {
        cfg = Config::load(argc > 1 ? argv[1] : "unilex.json");
    }
    catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    if (!Log::init(cfg.log_file, cfg.log_level)) {
        std::cerr << "Logging error: check 'log_file' in the config\n";
        return 1;
    }

    Vault vault(cfg.data_dir + "/unilex.salt");
    std::string passphrase;
    std::cout << "Passphrase: ";
    std::getline(std::cin, passphrase);
    if (!vault.unlock(passphrase)) {
        std::cout << "Could not unlock data.\n";
        return 1;
    }

    FileRepository repo(cfg.data_dir, vault.key());
    if (!repo.open()) {
        std::cout << "Wrong passphrase or corrupt data.\n";
        return 1;
    }

    OutcomeClassifier classifier(cfg.quality_policy, Scheduler(cfg.min_interval_hours));

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "1. Add Word\n"
            "2. Practice\n"
            "3. List All Words\n"
            "4. Progress Dashboard\n"
            "5. Save & Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore();

        if (choice == 1) {
            std::string term, meaning, tags_line;
            std::cout << "Enter term: "; std::getline(std::cin, term);
            if (term.empty()) { std::cout << "Term required.\n"; continue; }

            std::cout << "Enter meaning: "; std::getline(std::cin, meaning);
            std::cout << "Enter tags (comma-separated): "; std::getline(std::cin, tags_line);

            VocabItem it(term, meaning, std::time(nullptr));
            it.setTags(VocabItem::splitTagsLine(tags_line));
            if (!repo.save(it)) {
                std::cout << "Could not add word.\n";
                continue;
            }

            std::cout << "Word added.\n";
        }
        else if (choice == 2) {
            practice(repo, classifier, cfg);
        }
        else if (choice == 3) {
            listAllWords(repo.listAll(), std::time(nullptr));
        }
        else if (choice == 4) {
            dashboard(repo, cfg);
        }
        else if (choice == 5) {
            break;
        }
        else {
            std::cout << "Invalid.\n";
        }
    }

    const bool saved = repo.flush();
    repo.lock();
    vault.lock();
    if (!saved) {
        std::cout << "Error saving data.\n";
        return 1;
    }

    std::cout << "Goodbye!\n";
    return 0;
}
