#include "util.hpp"

#include <termios.h>

#include <array>
#include <thread>

std::atomic<bool> g_reset_timer{ false };
std::atomic<bool> g_timer_running{ true };


// ---------- Identifiers ----------
static std::string random_hex(size_t nbytes) {
    std::vector<byte> buf(nbytes);
    randombytes_buf(buf.data(), buf.size());

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(nbytes * 2);

    for (size_t i = 0; i < buf.size(); ++i) {
        out[2 * i] = hex[(buf[i] >> 4) & 0x0F];
        out[2 * i + 1] = hex[buf[i] & 0x0F];
    }
    return out;
}

std::string generate_session_id() {
    return random_hex(16);
}

std::string generate_entity_id() {
    std::string h = random_hex(16);
    return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
        h.substr(16, 4) + "-" + h.substr(20, 12);
}

std::string generate_device_id() {
    return random_hex(16);
}


// ---------- String helpers ----------
std::string to_lower(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}

void trim_spaces(std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    auto last = s.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) { s.clear(); return; }
    s = s.substr(first, last - first + 1);
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string w;
    while (iss >> w) out.push_back(w);
    return out;
}


// ---------- Helpers: input validation ----------
bool contains_control_or_tab_or_null(const std::string& s) {
    for (unsigned char c : s) {
        if (c == '\t' || c == '\0') return true;
        if ((c < 0x20) && c != '\n' && c != '\r') return true; // other control chars
    }
    return false;
}

bool valid_title(const std::string& s) {
    if (s.size() > MAX_TITLE_LEN) return false;
    return !contains_control_or_tab_or_null(s);
}

bool valid_tag(const std::string& s) {
    if (s.empty() || s.size() > MAX_TAG_LEN) return false;
    if (contains_control_or_tab_or_null(s)) return false;
    // disallow whitespace-only
    return !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool valid_profile_name(const std::string& s) {
    if (s.empty() || s.size() > MAX_PROFILE_NAME_LEN) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-'; // allow alnum, '_', '-'
        });
}


// ---------- Secure input ----------
static void disable_echo(bool disable) {
    termios tty;
    if (tcgetattr(STDIN_FILENO, &tty) != 0) return;

    if (disable) tty.c_lflag &= ~ECHO;
    else         tty.c_lflag |= ECHO;

    tcsetattr(STDIN_FILENO, TCSANOW, &tty);
}

SecureBuffer get_password_secure(const char* prompt) {
    std::cout << prompt;
    std::fflush(stdout);

    disable_echo(true);

    std::string s;
    std::getline(std::cin, s);

    disable_echo(false);
    std::cout << "\n";

    if (!s.empty() && s.back() == '\r') s.pop_back();

    SecureBuffer out = SecureBuffer::from_string(s);
    if (!s.empty()) {
        sodium_memzero(&s[0], s.size());
    }
    return out;
}


// ---------------- Inactivity timer implementation ----------------
void start_inactivity_timer(std::function<void()> on_timeout) {
    std::thread([on_timeout]() {
        int remaining = INACTIVITY_LIMIT;
        while (g_timer_running.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));

            if (g_reset_timer.exchange(false)) {
                remaining = INACTIVITY_LIMIT;
            }
            else {
                remaining--;
                if (remaining <= 0) {
                    on_timeout();
                    return;
                }
            }
        }
        }).detach();
}


// ---------- Program flow helpers ----------
void clear_screen() {
    // Clear visible screen and scrollback buffer
    std::cout << "\033[3J\033[2J\033[H";
}

void print_menu() {
    std::cout << "\n";
    std::cout << "zknotes - Menu:\n";
    std::cout << " 1) List notes\n";
    std::cout << " 2) New note\n";
    std::cout << " 3) Read note\n";
    std::cout << " 4) Edit note\n";
    std::cout << " 5) Delete note\n";
    std::cout << " 6) New folder\n";
    std::cout << " 7) Set note password\n";
    std::cout << " 8) Remove note password\n";
    std::cout << " 9) Sync now\n";
    std::cout << "10) Change account password\n";
    std::cout << "11) Quit\n";
}
