#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <limits>
#include <memory>
#include <optional>
#include <ctime>

#include "../utils/logging.hpp"
#include "../utils/strings.hpp"
#include "../config/Config.hpp"
#include "../core/Errors.hpp"
#include "../storage/VaultRepository.hpp"
#include "../app/StudyService.hpp"
#include "../app/CardDrafter.hpp"
#include "../export/MarkdownExporter.hpp"

std::string readLine(const std::string& prompt) {
    std::cout << prompt;
    std::string line;
    std::getline(std::cin, line);
    return Text::trim(line);
}

std::optional<std::string> readOptional(const std::string& prompt) {
    std::string v = readLine(prompt);
    if (v.empty()) return std::nullopt;
    return v;
}

long long readNumber(const std::string& prompt) {
    while (true) {
        std::cout << prompt;
        long long n;
        if (std::cin >> n) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return n;
        }
        if (std::cin.eof()) return -1;
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
}

int askQuality() {
    while (true) {
        std::cout << "\nHow well did you remember?\n"
            " 1 = AGAIN (Forgot)\n"
            " 2 = HARD\n"
            " 3 = GOOD\n"
            " 4 = EASY\n> ";
        int q;
        if (std::cin >> q && q >= 1 && q <= 4) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return q;
        }
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
}

std::string formatTime(const std::optional<std::time_t>& t) {
    if (!t) return "(never)";
    char buf[32];
    std::tm tm{};
    localtime_r(&*t, &tm);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

void printCard(const Card& c) {
    std::cout << "#" << c.id << " [" << toString(c.status) << "] " << c.front << "\n"
        << "   Answer: " << c.back << "\n";
    if (c.hint) std::cout << "   Hint: " << *c.hint << "\n";
    std::cout << "   Tags: " << (c.tags.empty() ? "(none)" : c.tagsAsLine()) << "\n"
        << "   Interval: " << c.sched.interval << " days | Ease: " << c.sched.ease_factor
        << " | Reps: " << c.sched.repetitions << "\n"
        << "   Next review: " << formatTime(c.sched.next_review) << "\n";
}

void printSource(const SourceSummary& row) {
    const Source& s = row.source;
    std::cout << "#" << s.id << " [" << toString(s.status) << "] " << s.displayTitle() << "\n"
        << "   Origin: " << toString(s.origin);
    if (s.origin_url) std::cout << " (" << *s.origin_url << ")";
    std::cout << "\n   Tags: " << (s.tags.empty() ? "(none)" : s.tagsAsLine())
        << "\n   Cards: " << row.card_count << "\n";
}

std::vector<CardDraft> typeDrafts() {
    std::vector<CardDraft> drafts;
    std::cout << "Enter cards; leave the question empty to finish.\n";
    while (true) {
        CardDraft d;
        d.front = readLine("Question: ");
        if (d.front.empty()) break;
        d.back = readLine("Answer: ");
        d.hint = readOptional("Hint (optional): ");
        d.tags = Text::splitCsv(readLine("Tags (comma-separated): "));
        drafts.push_back(d);
    }
    return drafts;
}

void captureSource(StudyService& study) {
    SourceInput in;
    in.text = readLine("Text to learn: ");
    in.origin = OriginKind::MANUAL;
    in.origin_title = readOptional("Title (optional): ");
    in.origin_url = readOptional("URL (optional): ");
    in.tags = Text::splitCsv(readLine("Tags (comma-separated): "));
    if (in.origin_url) in.origin = OriginKind::LINK_IMPORT;

    auto res = study.createSource(in);
    std::cout << (res.created ? "Source captured as #" : "Already captured as #") << res.source.id << ".\n";
}

// Empty answers keep the current value; "-" clears an optional field.
void editSource(StudyService& study) {
    Source s = study.getSource(readNumber("Source ID: "));
    std::cout << "\n> " << s.text << "\n"
        "Press Enter to keep a value, '-' to clear it.\n";

    SourceEdit edit;
    auto field = [](const std::string& prompt, std::optional<std::string>& target) {
        std::string v = readLine(prompt);
        if (v == "-") target = std::string();
        else if (!v.empty()) target = v;
    };
    field("Text: ", edit.text);
    field("Title: ", edit.origin_title);
    field("URL: ", edit.origin_url);
    std::string tags = readLine("Tags (comma-separated): ");
    if (tags == "-") edit.tags = std::vector<std::string>();
    else if (!tags.empty()) edit.tags = Text::splitCsv(tags);

    Source updated = study.editSource(s.id, edit);
    std::cout << "Source #" << updated.id << " updated.\n";
}

void generateCards(StudyService& study) {
    long long id = readNumber("Source id: ");
    Source s = study.getSource(id);
    std::cout << "\n> " << s.text << "\n\n"
        "1. Type cards\n"
        "2. Load drafts from JSON file\n> ";
    long long how = readNumber("");

    std::vector<Card> cards;
    if (how == 1) {
        StaticDrafter drafter(typeDrafts());
        cards = study.generateCards(id, drafter);
    }
    else if (how == 2) {
        JsonFileDrafter drafter(readLine("Draft file: "));
        cards = study.generateCards(id, drafter);
    }
    else {
        std::cout << "Invalid.\n";
        return;
    }
    std::cout << cards.size() << " draft card(s) ready for approval.\n";
}

void reviewDue(StudyService& study, std::size_t limit) {
    std::optional<std::string> tag = readOptional("Only tag (optional): ");
    DueCards due = study.listDue(tag, limit);
    if (due.cards.empty()) { std::cout << "No cards due.\n"; return; }
    std::cout << due.total_due << " card(s) due, reviewing " << due.cards.size() << ".\n";

    for (const auto& card : due.cards) {
        std::cout << "\nQ: " << card.front << "\n";
        if (card.hint) std::cout << "Hint: " << *card.hint << "\n";
        readLine("(press Enter to show the answer)");
        std::cout << "A: " << card.back << "\n";

        std::time_t shown = std::time(nullptr);
        int q = askQuality();
        int elapsed_ms = static_cast<int>((std::time(nullptr) - shown) * 1000);

        Card updated = study.submitReview(card.id, q - 1, elapsed_ms);
        std::cout << "Next review in " << updated.sched.interval << " day(s).\n";
    }
}

void listSources(StudyService& study) {
    SourceQuery q;
    std::string st = readLine("Status filter (pending_review/cards_generated/approved/archived, empty = all): ");
    if (!st.empty()) q.status = sourceStatusFromString(st);
    q.tag = readOptional("Tag filter (optional): ");
    q.per_page = 100;

    auto page = study.listSources(q);
    std::cout << "\n===== SOURCES (" << page.total << ") =====\n";
    for (const auto& row : page.items) printSource(row);
}

void listCards(StudyService& study) {
    CardQuery q;
    std::string st = readLine("Status filter (draft/active/suspended/mastered, empty = all): ");
    if (!st.empty()) q.status = cardStatusFromString(st);
    q.tag = readOptional("Tag filter (optional): ");
    q.per_page = 100;

    auto page = study.listCards(q);
    std::cout << "\n===== CARDS (" << page.total << ") =====\n";
    for (const auto& c : page.items) printCard(c);
}

void cardActions(StudyService& study) {
    long long id = readNumber("Card id: ");
    printCard(study.getCard(id));
    std::cout << "1. Activate / resume\n"
        "2. Suspend\n"
        "3. Mark mastered\n"
        "4. Edit\n"
        "5. Delete draft\n"
        "6. Review history\n"
        "7. Back\n> ";
    long long a = readNumber("");

    if (a == 1) printCard(study.setCardStatus(id, CardStatus::ACTIVE));
    else if (a == 2) printCard(study.setCardStatus(id, CardStatus::SUSPENDED));
    else if (a == 3) printCard(study.setCardStatus(id, CardStatus::MASTERED));
    else if (a == 4) {
        CardEdit e;
        e.front = readOptional("New question (empty = keep): ");
        e.back = readOptional("New answer (empty = keep): ");
        e.hint = readOptional("New hint (empty = keep): ");
        std::string tags = readLine("New tags (empty = keep): ");
        if (!tags.empty()) e.tags = Text::splitCsv(tags);
        printCard(study.editCard(id, e));
    }
    else if (a == 5) {
        study.deleteCard(id);
        std::cout << "Deleted.\n";
    }
    else if (a == 6) {
        auto logs = study.cardHistory(id);
        if (logs.empty()) std::cout << "(no reviews)\n";
        for (const auto& l : logs) {
            std::cout << "- " << formatTime(l.reviewed_at) << " | " << toString(l.quality)
                << " | interval " << l.before.interval << " -> " << l.after.interval << "\n";
        }
    }
}

void addManualCard(StudyService& study) {
    CardInput in;
    in.front = readLine("Question: ");
    in.back = readLine("Answer: ");
    in.hint = readOptional("Hint (optional): ");
    in.tags = Text::splitCsv(readLine("Tags (comma-separated): "));
    Card c = study.createCard(in, true);
    std::cout << "Card #" << c.id << " added and due now.\n";
}

void tagMenu(StudyService& study) {
    while (true) {
        std::cout << "\n=== TAGS ===\n"
            "1. List tags\n"
            "2. Create tag\n"
            "3. Tag statistics\n"
            "4. Delete tag\n"
            "5. Back\n> ";
        long long t = readNumber("");

        try {
            if (t == 1) {
                for (const auto& tag : study.tags())
                    std::cout << "- " << tag.name << (tag.color ? " (" + *tag.color + ")" : "") << "\n";
            }
            else if (t == 2) {
                std::string name = readLine("Name: ");
                Tag tag = study.createTag(name, readOptional("Color (optional): "));
                std::cout << "Created '" << tag.name << "'.\n";
            }
            else if (t == 3) {
                TagStats st = study.tagStats(readLine("Name: "));
                std::cout << st.tag.name << ": " << st.source_count << " source(s), "
                    << st.card_count << " card(s)\n";
            }
            else if (t == 4) {
                std::string name = readLine("Name: ");
                study.deleteTag(name);
                std::cout << "Deleted '" << Text::normalizeTag(name) << "'.\n";
            }
            else if (t == 5 || t < 0)
                break;
            else std::cout << "Invalid.\n";
        }
        catch (const RetainError& e) {
            std::cout << "Error: " << e.what() << "\n";
        }
    }
}

void exportMarkdown(StudyService& study, const AppConfig& cfg) {
    std::string vault = cfg.export_vault;
    if (vault.empty()) vault = readLine("Vault directory: ");
    if (vault.empty()) { std::cout << "No vault directory configured.\n"; return; }

    MarkdownExporter exporter(vault, cfg.export_folder);
    ExportReport r = exporter.exportAll(study.exportBundle());
    std::cout << "Exported " << r.sources_written << " source(s) and " << r.cards_written << " card(s).\n";
}

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    const std::string settings = argc > 1 ? argv[1] : "settings.json";
    AppConfig cfg = Config::load(settings);
    Log::init(cfg.log_file, cfg.log_level);

    // OPEN DATA FILE
    std::unique_ptr<VaultRepository> repo;
    while (!repo) {
        std::cout << "\n===== RETAIN =====\n"
            "Data file: " << cfg.data_file << "\n"
            "1. Open\n"
            "2. Exit\n> ";
        long long choice = readNumber("");
        if (choice == 2 || choice < 0) return 0;
        if (choice != 1) continue;

        std::string pass = readLine("Passphrase: ");
        if (pass.empty()) { std::cout << "Passphrase required.\n"; continue; }
        try {
            repo = std::make_unique<VaultRepository>(cfg.data_file, pass);
        }
        catch (const StorageError& e) {
            std::cout << "Could not open data file: " << e.what() << "\n";
        }
        sodium_memzero(&pass[0], pass.size());
    }

    std::unique_ptr<StudyService> study;
    try {
        study = std::make_unique<StudyService>(*repo, cfg.scheduler);
    }
    catch (const ValidationError& e) {
        std::cerr << "Invalid scheduler settings in '" << settings << "': " << e.what() << "\n";
        return 1;
    }

    // MAIN LOOP
    while (true) {
        DueCards due = study->listDue(std::nullopt, 0);
        std::cout << "\n===== MAIN MENU =====\n"
            "Cards due: " << due.total_due << "\n"
            "1. Capture source\n"
            "2. Generate cards for a source\n"
            "3. Approve source\n"
            "4. Archive source\n"
            "5. Review due cards\n"
            "6. List sources\n"
            "7. List cards\n"
            "8. Card actions\n"
            "9. Add card\n"
            "10. Tags\n"
            "11. Export to markdown\n"
            "12. Edit source\n"
            "13. Exit\n> ";

        long long choice = readNumber("");
        if (choice == 13 || choice < 0) break;

        try {
            switch (choice) {
            case 1: captureSource(*study); break;
            case 2: generateCards(*study); break;
            case 3: {
                ApprovalResult r = study->approve(readNumber("Source id: "));
                std::cout << "Approved; " << r.activated << " card(s) activated.\n";
                break;
            }
            case 4:
                study->archive(readNumber("Source id: "));
                std::cout << "Archived.\n";
                break;
            case 5: reviewDue(*study, cfg.due_limit); break;
            case 6: listSources(*study); break;
            case 7: listCards(*study); break;
            case 8: cardActions(*study); break;
            case 9: addManualCard(*study); break;
            case 10: tagMenu(*study); break;
            case 11: exportMarkdown(*study, cfg); break;
            case 12: editSource(*study); break;
            default: std::cout << "Invalid.\n";
            }
        }
        catch (const RetainError& e) {
            std::cout << "Error: " << e.what() << "\n";
        }
    }

    spdlog::info("Session closed");
    std::cout << "Goodbye!\n";
    return 0;
}
