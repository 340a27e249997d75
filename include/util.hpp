#pragma once
#include "zknotes_common.hpp"
#include "secure_buffer.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

// ---------- Identifiers ----------
std::string generate_session_id();
std::string generate_entity_id();   // 8-4-4-4-12 hex, random
std::string generate_device_id();

// ---------- String helpers ----------
std::string to_lower(const std::string& s);
void trim_spaces(std::string& s);
std::vector<std::string> split_words(const std::string& s);

// ---------- Helpers: input validation ----------
bool contains_control_or_tab_or_null(const std::string& s);
bool valid_title(const std::string& s);
bool valid_tag(const std::string& s);
bool valid_profile_name(const std::string& v);

// ---------- Secure input ----------
SecureBuffer get_password_secure(const char* prompt);

// ---------- Menu ----------
void clear_screen();
void print_menu();

// ---------- Timer ----------
extern std::atomic<bool> g_reset_timer;
extern std::atomic<bool> g_timer_running;
constexpr int INACTIVITY_LIMIT = 300; // seconds
void start_inactivity_timer(std::function<void()> on_timeout);
