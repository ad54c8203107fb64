/*
 * toolgate C++17 - Command Policy Implementation
 */
#include <toolgate/core/command_policy.hpp>
#include <toolgate/core/config.hpp>
#include <toolgate/core/logger.hpp>
#include <toolgate/core/utils.hpp>

#include <algorithm>

namespace toolgate {

namespace {

// Words that run the rest of the segment as a command
const char* const kWrappers[] = {
    "sudo", "doas", "env", "nohup", "time", "exec", "command", "nice", "ionice", "xargs", NULL
};

bool is_wrapper(const std::string& word) {
    for (int i = 0; kWrappers[i] != NULL; ++i) {
        if (word == kWrappers[i]) return true;
    }
    return false;
}

bool is_assignment(const std::string& word) {
    size_t eq = word.find('=');
    if (eq == std::string::npos || eq == 0) return false;
    for (size_t i = 0; i < eq; ++i) {
        char c = word[i];
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

std::string strip_quotes(const std::string& word) {
    if (word.size() >= 2) {
        char first = word.front();
        char last = word.back();
        if ((first == '"' || first == '\'') && first == last) {
            return word.substr(1, word.size() - 2);
        }
    }
    return word;
}

std::vector<std::string> split_words(const std::string& segment) {
    std::vector<std::string> words;
    std::vector<std::string> raw = split(segment, ' ');
    for (size_t i = 0; i < raw.size(); ++i) {
        if (!raw[i].empty()) words.push_back(raw[i]);
    }
    return words;
}

bool is_root_operand(const std::string& operand) {
    std::string op = strip_quotes(operand);
    if (op == "~" || op == "~/" || op == "~/*" ||
        op == "$home" || op == "$home/" || op == "$home/*" ||
        op == "${home}" || op == "${home}/" || op == "${home}/*") {
        return true;
    }
    if (!op.empty() && op[0] == '/') {
        std::string normalized = normalize_path(op);
        return normalized == "/" || normalized == "/*";
    }
    return false;
}

// std::regex recurses per character, so long input is scanned in
// overlapping windows. A match is accepted when it starts in the first half
// of its window and ends clear of the window edge, or when the window reaches
// the end of the command.
const size_t kRegexWindow = 8192;
const size_t kRegexStep = kRegexWindow / 2;
const size_t kRegexEdge = 16;

bool windowed_search(const std::string& text, const std::regex& re) {
    if (text.size() <= kRegexWindow) {
        return std::regex_search(text, re);
    }

    for (size_t start = 0; start < text.size(); start += kRegexStep) {
        size_t len = std::min(kRegexWindow, text.size() - start);
        bool last = start + len == text.size();
        std::string::const_iterator first = text.begin() + start;
        std::regex_constants::match_flag_type flags = std::regex_constants::match_default;
        if (start > 0) {
            flags |= std::regex_constants::match_prev_avail;
        }

        std::smatch m;
        if (std::regex_search(first, first + len, m, re, flags)) {
            size_t pos = static_cast<size_t>(m.position(0));
            if (last) return true;
            if (pos < kRegexStep && pos + static_cast<size_t>(m.length(0)) + kRegexEdge <= len) return true;
        }
        if (last) break;
    }
    return false;
}

} // namespace

const char* verdict_name(Verdict verdict) {
    switch (verdict) {
        case Verdict::Allowed: return "allowed";
        case Verdict::Warn: return "warn";
        case Verdict::Blocked: return "blocked";
    }
    return "unknown";
}

CommandPolicy::CommandPolicy() {
    add_default_rules();
}

CommandPolicy::CommandPolicy(const Config& cfg) {
    add_default_rules();

    std::vector<std::string> blocked = cfg.get_string_list("policy.blocked_commands");
    for (size_t i = 0; i < blocked.size(); ++i) {
        add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::Substring,
                            blocked[i], "Command matches blocked pattern '" + blocked[i] + "'"));
    }

    std::vector<std::string> dangerous = cfg.get_string_list("policy.dangerous_patterns");
    for (size_t i = 0; i < dangerous.size(); ++i) {
        add_rule(PolicyRule(RuleTier::Destructive, MatchMode::Substring,
                            dangerous[i], "Command contains potentially dangerous pattern '" + dangerous[i] + "'"));
    }

    LOG_DEBUG("Command policy loaded with %zu rules (%zu configured blocks, %zu configured warnings)",
              rules_.size(), blocked.size(), dangerous.size());
}

void CommandPolicy::add_default_rules() {
    // ── Hard block: near-zero legitimate use ──
    add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::RmRootTarget, "",
                        "Recursive force delete of a root directory"));
    // Function names are capped at 64 characters to keep backtracking linear
    add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::Regex,
                        "([a-z_:][a-z0-9_:]{0,63})\\s*\\(\\)\\s*\\{\\s*\\1\\s*\\|\\s*\\1\\s*&\\s*\\}\\s*;\\s*\\1",
                        "Fork bomb"));
    add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::Substring, "rm -rf /*",
                        "Recursive force delete of the root filesystem"));
    add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::SegmentPrefix, "mkfs",
                        "Filesystem format"));
    add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::Substring, "dd if=/dev/zero",
                        "Disk wipe with dd"));
    add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::Substring, "dd if=/dev/random",
                        "Disk wipe with dd"));
    add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::Substring, "dd if=/dev/urandom",
                        "Disk wipe with dd"));
    add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::Regex,
                        ">\\s*/dev/(sd[a-z]|hd[a-z]|nvme[0-9]|vd[a-z]|xvd[a-z]|mmcblk[0-9])",
                        "Raw write to a block device"));
    add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::Substring, "mv /* /dev/null",
                        "Moving the root filesystem to /dev/null"));
    add_rule(PolicyRule(RuleTier::HardBlock, MatchMode::Regex,
                        "\\b(curl|wget)\\b[^;&|]*\\|\\s*(sudo\\s+)?(sh|bash|zsh|dash|ksh)\\b",
                        "Piping a download straight into a shell"));

    // ── Privilege escalation: run, but flag ──
    const char* const elevation[] = { "sudo", "su", "doas", "pkexec", NULL };
    for (int i = 0; elevation[i] != NULL; ++i) {
        add_rule(PolicyRule(RuleTier::PrivilegeEscalation, MatchMode::SegmentCommand, elevation[i],
                            std::string("Privilege escalation via '") + elevation[i] + "'"));
    }

    // ── Destructive but scoped: run, but flag ──
    add_rule(PolicyRule(RuleTier::Destructive, MatchMode::RmRecursiveForce, "",
                        "Recursive force delete"));
    add_rule(PolicyRule(RuleTier::Destructive, MatchMode::Substring, "chmod 777",
                        "World-writable permissions (chmod 777)"));
    add_rule(PolicyRule(RuleTier::Destructive, MatchMode::Substring, "chmod -r 777",
                        "World-writable permissions (chmod 777)"));
    add_rule(PolicyRule(RuleTier::Destructive, MatchMode::SegmentCommand, "chown",
                        "Ownership change (chown)"));
    add_rule(PolicyRule(RuleTier::Destructive, MatchMode::Regex,
                        ">\\s*/dev/(?!null\\b|stdout\\b|stderr\\b|tty\\b|fd/)",
                        "Write to a device file"));
    const char* const system_commands[] = { "dd", "fdisk", "parted", "shutdown", "reboot", "halt", "poweroff", "init", NULL };
    for (int i = 0; system_commands[i] != NULL; ++i) {
        add_rule(PolicyRule(RuleTier::Destructive, MatchMode::SegmentCommand, system_commands[i],
                            std::string("Command contains potentially dangerous pattern '") + system_commands[i] + "'"));
    }
}

bool CommandPolicy::add_rule(const PolicyRule& rule) {
    PolicyRule r = rule;
    r.pattern = to_lower(r.pattern);

    bool needs_pattern = r.mode != MatchMode::RmRecursiveForce && r.mode != MatchMode::RmRootTarget;
    if (needs_pattern && trim(r.pattern).empty()) {
        LOG_WARN("Ignoring policy rule with empty pattern (%s)", r.reason.c_str());
        return false;
    }

    if (r.mode == MatchMode::Regex) {
        try {
            r.compiled = std::make_shared<std::regex>(r.pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            LOG_ERROR("Invalid policy regex '%s': %s", r.pattern.c_str(), e.what());
            return false;
        }
    } else if (r.mode == MatchMode::Substring || r.mode == MatchMode::SegmentPrefix) {
        r.pattern = normalize(r.pattern);
    }

    rules_.push_back(r);
    return true;
}

std::string CommandPolicy::normalize(const std::string& command) {
    std::string lower = to_lower(command);
    std::string cleaned;
    cleaned.reserve(lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        char c = lower[i];
        if (c == '\r' || c == '\t' || c == '\v' || c == '\f') c = ' ';
        cleaned.push_back(c);
    }
    return trim(collapse_spaces(cleaned));
}

std::vector<std::string> CommandPolicy::split_segments(const std::string& normalized) {
    std::vector<std::string> segments;
    std::string current;

    for (size_t i = 0; i < normalized.size(); ++i) {
        char c = normalized[i];
        bool separator = false;

        if (c == ';' || c == '\n') {
            separator = true;
        } else if (c == '|') {
            separator = true;
            if (i + 1 < normalized.size() && normalized[i + 1] == '|') ++i;
        } else if (c == '&') {
            if (i + 1 < normalized.size() && normalized[i + 1] == '&') {
                separator = true;
                ++i;
            } else {
                // 2>&1, &> and >& are redirections, not background separators
                bool redir_before = i > 0 && (normalized[i - 1] == '>' || normalized[i - 1] == '<');
                bool redir_after = i + 1 < normalized.size() && normalized[i + 1] == '>';
                separator = !redir_before && !redir_after;
            }
        }

        if (separator) {
            std::string seg = trim(current);
            if (!seg.empty()) segments.push_back(seg);
            current.clear();
        } else {
            current.push_back(c);
        }
    }

    std::string seg = trim(current);
    if (!seg.empty()) segments.push_back(seg);
    return segments;
}

std::vector<std::string> CommandPolicy::command_words(const std::string& segment) {
    std::vector<std::string> words = split_words(segment);
    size_t i = 0;
    while (i < words.size()) {
        std::string word = strip_quotes(words[i]);
        if (word == "(" || word == "{") {
            ++i;
        } else if (is_assignment(word)) {
            ++i;
        } else if (is_wrapper(base_name(word))) {
            ++i;
            // wrapper options, e.g. sudo -u root, nice -n 5
            while (i < words.size() && !words[i].empty() && words[i][0] == '-') {
                bool takes_value = words[i] == "-u" || words[i] == "-g" || words[i] == "-n";
                ++i;
                if (takes_value && i < words.size()) ++i;
            }
        } else {
            break;
        }
    }

    std::vector<std::string> out;
    for (; i < words.size(); ++i) {
        out.push_back(strip_quotes(words[i]));
    }
    if (!out.empty()) {
        out[0] = base_name(out[0]);
    }
    return out;
}

bool CommandPolicy::is_recursive_force_rm(const std::vector<std::string>& words, bool& root_target) {
    root_target = false;
    if (words.empty() || words[0] != "rm") return false;

    bool recursive = false;
    bool force = false;
    bool options_done = false;

    for (size_t i = 1; i < words.size(); ++i) {
        const std::string& w = words[i];
        if (!options_done && w == "--") {
            options_done = true;
        } else if (!options_done && starts_with(w, "--")) {
            if (w == "--recursive") recursive = true;
            else if (w == "--force") force = true;
        } else if (!options_done && w.size() > 1 && w[0] == '-') {
            // words are lowercased, so -R shows up as -r
            if (w.find('r') != std::string::npos) recursive = true;
            if (w.find('f') != std::string::npos) force = true;
        } else if (is_root_operand(w)) {
            root_target = true;
        }
    }

    if (!(recursive && force)) {
        root_target = false;
        return false;
    }
    return true;
}

bool CommandPolicy::matches(const PolicyRule& rule, const std::string& normalized,
                            const std::vector<std::string>& segments) {
    switch (rule.mode) {
        case MatchMode::Substring:
            return normalized.find(rule.pattern) != std::string::npos;

        case MatchMode::Regex:
            if (!rule.compiled) return false;
            try {
                return windowed_search(normalized, *rule.compiled);
            } catch (const std::regex_error& e) {
                LOG_WARN("[Policy] Rule '%s' failed to evaluate: %s", rule.pattern.c_str(), e.what());
                return false;
            }

        case MatchMode::SegmentPrefix:
            for (size_t i = 0; i < segments.size(); ++i) {
                if (starts_with(segments[i], rule.pattern)) return true;
                std::vector<std::string> words = command_words(segments[i]);
                if (!words.empty() && starts_with(join(words, " "), rule.pattern)) return true;
            }
            return false;

        case MatchMode::SegmentCommand:
            for (size_t i = 0; i < segments.size(); ++i) {
                std::vector<std::string> raw = split_words(segments[i]);
                if (!raw.empty() && base_name(strip_quotes(raw[0])) == rule.pattern) return true;
                std::vector<std::string> words = command_words(segments[i]);
                if (!words.empty() && words[0] == rule.pattern) return true;
            }
            return false;

        case MatchMode::RmRecursiveForce:
        case MatchMode::RmRootTarget:
            for (size_t i = 0; i < segments.size(); ++i) {
                bool root_target = false;
                if (is_recursive_force_rm(command_words(segments[i]), root_target)) {
                    if (rule.mode == MatchMode::RmRecursiveForce || root_target) return true;
                }
            }
            return false;
    }
    return false;
}

Classification CommandPolicy::classify(const std::string& command) const {
    const std::string normalized = normalize(command);
    const std::vector<std::string> segments = split_segments(normalized);

    const RuleTier tiers[] = { RuleTier::HardBlock, RuleTier::PrivilegeEscalation, RuleTier::Destructive };
    for (size_t t = 0; t < sizeof(tiers) / sizeof(tiers[0]); ++t) {
        for (size_t i = 0; i < rules_.size(); ++i) {
            const PolicyRule& rule = rules_[i];
            if (rule.tier != tiers[t] || !matches(rule, normalized, segments)) {
                continue;
            }
            if (rule.tier == RuleTier::HardBlock) {
                return Classification(Verdict::Blocked, rule.reason);
            }
            return Classification(Verdict::Warn, rule.reason);
        }
    }
    return Classification();
}

} // namespace toolgate
