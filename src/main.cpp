#include "account.hpp"
#include "config.hpp"
#include "io.hpp"
#include "lockout.hpp"
#include "logging.hpp"
#include "notebook.hpp"
#include "scheduler.hpp"
#include "sync_engine.hpp"
#include "util.hpp"

#include <curl/curl.h>

#include <atomic>
#include <memory>

// ---------------- helper: check whitespace-only secrets ----------------
static bool is_all_space(const SecureBuffer& b) {
    if (b.size() == 0) return true;
    const byte* p = b.data();
    for (size_t i = 0; i < b.size(); ++i) {
        if (std::isspace(static_cast<unsigned char>(p[i])) == 0) {
            return false;
        }
    }
    return true;
}

static bool same_secret(const SecureBuffer& a, const SecureBuffer& b) {
    return a.size() == b.size() && sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

static inline int parse_choice(const std::string& s) {
    try {
        return std::stoi(s);
    }
    catch (const std::exception&) {
        return -1;
    }
}

// ---------------- input helpers ----------------
static bool read_line(const char* prompt, std::string& out) {
    std::cout << prompt;
    std::fflush(stdout);
    if (!std::getline(std::cin, out)) return false;
    if (!out.empty() && out.back() == '\r') out.pop_back();
    g_reset_timer = true;
    return true;
}

// Body ends at a line holding a single '.'
static bool read_body(std::string& out) {
    std::cout << "Content (end with a line containing only '.'):\n";
    out.clear();
    std::string line;
    while (std::getline(std::cin, line)) {
        g_reset_timer = true;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line == ".") return true;
        if (!out.empty()) out += "\n";
        out += line;
        if (out.size() > MAX_CONTENT_LEN) return false;
    }
    return false;
}

static bool new_password_twice(const char* prompt, SecureBuffer& out) {
    SecureBuffer pw1 = get_password_secure(prompt);
    SecureBuffer pw2 = get_password_secure("Confirm password: ");
    g_reset_timer = true;
    if (pw1.size() == 0 || is_all_space(pw1) || pw1.size() > MAX_PASS_LEN) {
        std::cout << "Password cannot be empty or whitespace.\n";
        return false;
    }
    if (!same_secret(pw1, pw2)) {
        std::cout << "Passwords do not match.\n";
        return false;
    }
    out = std::move(pw1);
    return true;
}

static void report(ZkStatus st) {
    std::cout << user_message(st) << "\n";
}

// ---------------- listing ----------------
struct Listing {
    std::vector<std::string> note_ids;
    std::vector<std::string> folder_ids;
};

static ZkStatus list_tree(
    Notebook& nb,
    const SessionContext& s,
    const std::string& folder_id,
    int depth,
    Listing& listing
)
{
    std::string indent(static_cast<size_t>(depth) * 2, ' ');

    std::vector<NoteSummary> notes;
    ZkStatus st = nb.list_notes(s, folder_id, notes);
    if (!ok(st)) return st;
    for (const auto& n : notes) {
        listing.note_ids.push_back(n.id);
        std::cout << indent << "[" << listing.note_ids.size() << "] "
            << (n.is_pinned ? "* " : "")
            << (n.has_password ? "(locked)" : n.title);
        if (!n.tags.empty()) {
            std::cout << "  #";
            for (size_t i = 0; i < n.tags.size(); ++i) std::cout << (i ? " #" : "") << n.tags[i];
        }
        std::cout << "\n";
    }

    std::vector<FolderSummary> folders;
    st = nb.list_folders(s, folder_id, folders);
    if (!ok(st)) return st;
    for (const auto& f : folders) {
        listing.folder_ids.push_back(f.id);
        std::cout << indent << "<" << listing.folder_ids.size() << "> "
            << (f.has_password ? "(locked folder)" : f.name) << "/\n";
        if (!f.has_password) {
            st = list_tree(nb, s, f.id, depth + 1, listing);
            if (!ok(st)) return st;
        }
    }
    return ZkStatus::OK;
}

static bool pick_note(Notebook& nb, const SessionContext& s, std::string& id) {
    Listing listing;
    ZkStatus st = list_tree(nb, s, "", 0, listing);
    if (!ok(st)) { report(st); return false; }
    if (listing.note_ids.empty()) {
        std::cout << "No notes.\n";
        return false;
    }
    std::string choice;
    if (!read_line("Note number: ", choice)) return false;
    trim_spaces(choice);
    int n = parse_choice(choice);
    if (n < 1 || static_cast<size_t>(n) > listing.note_ids.size()) {
        std::cout << "Unknown note\n";
        return false;
    }
    id = listing.note_ids[static_cast<size_t>(n) - 1];
    return true;
}

// Empty answer picks the top level
static bool pick_folder(Notebook& nb, const SessionContext& s, std::string& id) {
    Listing listing;
    ZkStatus st = list_tree(nb, s, "", 0, listing);
    if (!ok(st)) { report(st); return false; }
    std::string choice;
    if (!read_line("Folder number (empty for top level): ", choice)) return false;
    trim_spaces(choice);
    if (choice.empty()) { id.clear(); return true; }
    int n = parse_choice(choice);
    if (n < 1 || static_cast<size_t>(n) > listing.folder_ids.size()) {
        std::cout << "Unknown folder\n";
        return false;
    }
    id = listing.folder_ids[static_cast<size_t>(n) - 1];
    return true;
}

// Decrypts a note, asking for its own password when it has one
static ZkStatus open_note(Notebook& nb, const SessionContext& s, const std::string& id, NotePlain& out) {
    ZkStatus st = nb.read_note(s, id, out);
    if (st != ZkStatus::PASSWORD_REQUIRED) return st;

    const int64_t now = system_now_ms();
    LockoutState lock = nb.lockout_of(id);
    if (lockout_is_locked(lock, now)) {
        std::cout << "Locked for another " << (lockout_remaining_ms(lock, now) + 999) / 1000 << " seconds.\n";
        return ZkStatus::LOCKOUT_ACTIVE;
    }
    SecureBuffer pw = get_password_secure("Note password: ");
    g_reset_timer = true;
    st = nb.unlock_note(s, id, pw, out);
    if (st == ZkStatus::AUTHENTICATION_FAILURE) {
        int left = lockout_attempts_left(nb.lockout_of(id), system_now_ms());
        if (left > 0) std::cout << left << " attempts left.\n";
    }
    return st;
}

// ---------------- sync ----------------
static ZkStatus run_sync(SyncEngine& engine, Account& account, SessionContext& session, bool interactive) {
    SyncStats stats;
    ZkStatus st = engine.sync(session, stats);
    if (!ok(st)) return st;

    if (stats.key_rotation_required && engine.pending_key_store()) {
        if (!interactive) return ZkStatus::OK;
        std::cout << "Your account password was changed on another device.\n";
        SecureBuffer pw = get_password_secure("Current account password: ");
        g_reset_timer = true;
        st = account.adopt_remote_key_store(*engine.pending_key_store(), pw, session);
        if (!ok(st)) return st;
        engine.clear_pending_key_store();
        st = engine.sync(session, stats);
        if (!ok(st)) return st;
    }

    if (interactive) {
        std::cout << "Synced: " << stats.pulled << " pulled, "
            << (stats.created + stats.updated) << " pushed";
        if (stats.conflicts > 0) std::cout << ", " << stats.conflicts << " conflicts resolved";
        std::cout << "\n";
    }
    return ZkStatus::OK;
}

// ---------------- account setup ----------------
static bool do_register(Account& account, SessionContext& session) {
    std::string user;
    if (!read_line("Account name: ", user)) return false;
    trim_spaces(user);
    if (!valid_profile_name(user)) {
        std::cout << "Invalid account name (letters, digits, '_' and '-')\n";
        return false;
    }

    SecureBuffer pw;
    if (!new_password_twice("Create account password: ", pw)) return false;

    RecoveryKey recovery;
    ZkStatus st = account.register_account(user, pw, session, recovery);
    if (!ok(st)) {
        report(st);
        return false;
    }

    std::cout << "\nRecovery key. Write these 24 words down; they are shown only once:\n\n";
    for (size_t i = 0; i < recovery.words.size(); ++i) {
        std::cout << (i + 1 < 10 ? " " : "") << (i + 1) << ". " << recovery.words[i]
            << ((i % 4 == 3) ? "\n" : "\t");
    }
    std::string ack;
    read_line("\nPress Enter once they are stored safely.", ack);
    for (auto& w : recovery.words) {
        if (!w.empty()) sodium_memzero(&w[0], w.size());
    }
    clear_screen();
    return true;
}

static bool do_recover(Account& account, SessionContext& session) {
    std::string phrase;
    if (!read_line("Recovery key (24 words): ", phrase)) return false;
    std::vector<std::string> words = split_words(phrase);
    sodium_memzero(&phrase[0], phrase.size());

    SecureBuffer pw;
    if (!new_password_twice("New account password: ", pw)) return false;

    ZkStatus st = account.recover(words, pw, session);
    for (auto& w : words) sodium_memzero(&w[0], w.size());
    if (!ok(st)) {
        std::cout << "Recovery failed.\n";
        return false;
    }
    std::cout << "Account recovered. The new password is now in effect.\n";
    return true;
}

static bool do_login(Account& account, SessionContext& session) {
    int attempts = 0;
    while (attempts < MAX_PASSWORD_ATTEMPTS) {
        SecureBuffer pw = get_password_secure("Account password (empty to use recovery key): ");
        if (pw.size() == 0) {
            if (!std::cin) return false;
            return do_recover(account, session);
        }
        if (is_all_space(pw) || pw.size() > MAX_PASS_LEN) {
            attempts++;
            std::cout << "Invalid password.\n";
            continue;
        }
        ZkStatus st = account.login(pw, session);
        if (ok(st)) return true;
        attempts++;
        if (st != ZkStatus::AUTHENTICATION_FAILURE) {
            report(st);
            return false;
        }
        if (attempts < MAX_PASSWORD_ATTEMPTS) std::cout << "Incorrect password.\n";
    }
    std::cerr << "Too many failed attempts; exiting.\n";
    audit_log_level(LogLevel::ALERT,
        "Too many failed account password attempts",
        "login",
        "failure");
    return false;
}

// -----------------------------------------------------------------------
// main
// -----------------------------------------------------------------------
int main(int argc, char** argv) {
    std::string profile = argc > 1 ? argv[1] : "default";

    if (sodium_init() < 0) {
        std::fprintf(stderr, "libsodium initialization failed.\n");
        return 1;
    }
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::fprintf(stderr, "libcurl initialization failed.\n");
        return 1;
    }

    init_log_context();
    if (!init_data_paths(profile)) {
        std::fprintf(stderr, "Failed to initialize data directory for profile '%s'.\n", profile.c_str());
        curl_global_cleanup();
        return 1;
    }

    SyncConfig cfg;
    ZkStatus st = load_or_create_config(g_config_path, cfg);
    if (!ok(st)) {
        std::cerr << "Invalid configuration in " << g_config_path << "\n";
        curl_global_cleanup();
        return 1;
    }
    set_log_device(cfg.device_id);
    audit_log_level(LogLevel::INFO,
        "zknotes starting",
        "session",
        "notify");

    FileLocalStore store(g_store_path);
    st = store.load();
    if (!ok(st)) {
        report(st);
        curl_global_cleanup();
        return 2;
    }

    Account account(store, cfg.device_id);
    Notebook notebook(store, cfg.device_id);
    SyncScheduler scheduler(cfg.interval_minutes, static_cast<int64_t>(cfg.quiet_period_seconds) * 1000);
    notebook.set_scheduler(&scheduler);

    std::unique_ptr<SyncAdapter> adapter = make_sync_adapter(cfg);
    std::unique_ptr<SyncEngine> engine;
    if (adapter) engine = std::make_unique<SyncEngine>(store, *adapter, cfg.device_id);

    SessionContext session;

    // ---------------- Account setup / unlock ----------------
    bool opened = false;
    if (!account.registered()) {
        std::cout << "No account on this device.\n";
        std::cout << " 1) Register a new account\n";
        if (engine) std::cout << " 2) Link this device to an existing account\n";
        std::string choice;
        if (read_line("> ", choice)) {
            trim_spaces(choice);
            int opt = parse_choice(choice);
            if (opt == 1) {
                opened = do_register(account, session);
            }
            else if (opt == 2 && engine) {
                st = engine->bootstrap();
                if (!ok(st)) report(st);
                else opened = do_login(account, session);
            }
        }
    }
    else {
        opened = do_login(account, session);
    }

    if (!opened) {
        session.wipe();
        curl_global_cleanup();
        return 3;
    }
    set_log_user(session.user_id());

    const int64_t started = system_now_ms();
    scheduler.start(started);
    if (engine) {
        st = run_sync(*engine, account, session, true);
        if (!ok(st)) report(st);
        scheduler.on_sync_done(system_now_ms());
    }

    // ---------------- Start inactivity timer ----------------
    std::atomic<bool> timed_out{ false };
    g_timer_running = true;
    g_reset_timer = true;
    start_inactivity_timer([&timed_out]() {
        std::cout << "\n[!] Locked due to inactivity.\n";
        audit_log_level(LogLevel::INFO,
            "Session closed due to inactivity timeout",
            "session_timeout",
            "success");
        timed_out = true;
        close(STDIN_FILENO); // break getline()
        g_timer_running = false;
        });

    // ---------------- Main CLI loop ----------------
    bool running = true;
    while (running) {
        if (engine && scheduler.due(system_now_ms())) {
            st = run_sync(*engine, account, session, false);
            if (!ok(st)) audit_log_level(LogLevel::WARN,
                std::string("Scheduled sync failed: ") + status_str(st),
                "sync",
                "failure");
            scheduler.on_sync_done(system_now_ms());
        }

        print_menu();
        std::string choice;
        if (!read_line("> ", choice)) {
            break; // EOF or stdin closed
        }
        trim_spaces(choice);

        int opt = parse_choice(choice);
        switch (opt) {
        case 1: {
            Listing listing;
            st = list_tree(notebook, session, "", 0, listing);
            if (!ok(st)) report(st);
            else if (listing.note_ids.empty() && listing.folder_ids.empty()) std::cout << "No notes.\n";
            break;
        }
        case 2: {
            std::string folder_id;
            if (!pick_folder(notebook, session, folder_id)) break;
            std::string title, content;
            if (!read_line("Title: ", title)) break;
            if (!valid_title(title)) {
                std::cout << "Invalid title\n";
                break;
            }
            if (!read_body(content)) {
                std::cout << "Invalid content\n";
                break;
            }
            std::string id;
            st = notebook.create_note(session, title, content, folder_id, id);
            report(st);
            sodium_memzero(&content[0], content.size());
            break;
        }
        case 3: {
            std::string id;
            if (!pick_note(notebook, session, id)) break;
            NotePlain plain;
            st = open_note(notebook, session, id, plain);
            if (!ok(st)) {
                report(st);
                break;
            }
            std::cout << "\n== " << plain.title << " ==\n" << plain.content << "\n";
            sodium_memzero(&plain.content[0], plain.content.size());
            break;
        }
        case 4: {
            std::string id;
            if (!pick_note(notebook, session, id)) break;
            NotePlain plain;
            st = notebook.read_note(session, id, plain);
            SecureBuffer pw;
            if (st == ZkStatus::PASSWORD_REQUIRED) {
                pw = get_password_secure("Note password: ");
                st = notebook.unlock_note(session, id, pw, plain);
            }
            if (!ok(st)) {
                report(st);
                break;
            }
            std::string title, content;
            if (!read_line("New title (empty keeps current): ", title)) break;
            if (title.empty()) title = plain.title;
            if (!valid_title(title)) {
                std::cout << "Invalid title\n";
                break;
            }
            if (!read_body(content)) {
                std::cout << "Invalid content\n";
                break;
            }
            st = notebook.update_note(session, id, title, content, pw.empty() ? nullptr : &pw);
            report(st);
            sodium_memzero(&content[0], content.size());
            break;
        }
        case 5: {
            std::string id;
            if (!pick_note(notebook, session, id)) break;
            std::string confirm;
            if (!read_line("Type 'yes' to delete: ", confirm)) break;
            if (confirm != "yes") break;
            st = notebook.delete_note(session, id);
            report(st);
            break;
        }
        case 6: {
            std::string parent;
            if (!pick_folder(notebook, session, parent)) break;
            std::string name;
            if (!read_line("Folder name: ", name)) break;
            trim_spaces(name);
            if (name.empty() || !valid_title(name)) {
                std::cout << "Invalid name\n";
                break;
            }
            std::string id;
            st = notebook.create_folder(session, name, parent, id);
            report(st);
            break;
        }
        case 7: {
            std::string id;
            if (!pick_note(notebook, session, id)) break;
            SecureBuffer pw;
            if (!new_password_twice("Note password: ", pw)) break;
            st = notebook.set_note_password(session, id, pw);
            report(st);
            break;
        }
        case 8: {
            std::string id;
            if (!pick_note(notebook, session, id)) break;
            SecureBuffer pw = get_password_secure("Note password: ");
            g_reset_timer = true;
            st = notebook.remove_note_password(session, id, pw);
            report(st);
            break;
        }
        case 9: {
            if (!engine) {
                std::cout << "Sync is not configured (sync_target = none).\n";
                break;
            }
            st = run_sync(*engine, account, session, true);
            if (!ok(st)) report(st);
            scheduler.on_sync_done(system_now_ms());
            break;
        }
        case 10: {
            SecureBuffer old_pw = get_password_secure("Current account password: ");
            SecureBuffer new_pw;
            if (!new_password_twice("New account password: ", new_pw)) break;
            st = account.change_password(session, old_pw, new_pw);
            report(st);
            if (ok(st)) scheduler.request_now();
            break;
        }
        case 11: {
            running = false;
            break;
        }
        default:
            std::cout << "Unknown option\n";
            break;
        }
    }

    g_timer_running = false;
    if (!timed_out && engine && scheduler.flush_pending()) {
        st = run_sync(*engine, account, session, false);
        if (!ok(st)) report(st);
    }
    account.logout(session);
    clear_screen();
    std::cout << "Goodbye.\n";
    audit_log_level(LogLevel::INFO,
        "Session ended",
        "session",
        timed_out ? "timeout" : "success");
    curl_global_cleanup();
    return 0;
}
