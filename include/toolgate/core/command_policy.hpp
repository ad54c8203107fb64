/*
 * toolgate C++17 - Command Policy
 *
 * Textual screening of shell commands before they run. Rules are evaluated
 * in tier order: hard block, privilege escalation, destructive. The first
 * match decides. Blocked commands never run; warned commands run with the
 * reason attached to their result.
 *
 * This is a best-effort heuristic over the command text. Quoting, variable
 * expansion, aliases or an interpreter one level down will get past it.
 */
#ifndef toolgate_CORE_COMMAND_POLICY_HPP
#define toolgate_CORE_COMMAND_POLICY_HPP

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace toolgate {

class Config;

enum class Verdict {
    Allowed,
    Warn,
    Blocked
};

enum class RuleTier {
    HardBlock,
    PrivilegeEscalation,
    Destructive
};

enum class MatchMode {
    Substring,          // anywhere in the normalized command
    SegmentPrefix,      // a ;/&&/||/| separated segment starts with the pattern
    SegmentCommand,     // a segment's command word equals the pattern
    Regex,              // ECMAScript regex searched in the normalized command
    RmRecursiveForce,   // rm -r -f with any operand (pattern unused)
    RmRootTarget        // rm -r -f aimed at / or ~ (pattern unused)
};

struct PolicyRule {
    RuleTier tier;
    MatchMode mode;
    std::string pattern;    // lowercase
    std::string reason;
    std::shared_ptr<std::regex> compiled;   // Regex mode only

    PolicyRule() : tier(RuleTier::Destructive), mode(MatchMode::Substring) {}
    PolicyRule(RuleTier t, MatchMode m, const std::string& p, const std::string& r)
        : tier(t), mode(m), pattern(p), reason(r) {}
};

struct Classification {
    Verdict verdict;
    std::string reason;     // empty when Allowed

    Classification() : verdict(Verdict::Allowed) {}
    Classification(Verdict v, const std::string& r) : verdict(v), reason(r) {}

    bool blocked() const { return verdict == Verdict::Blocked; }
    bool warned() const { return verdict == Verdict::Warn; }
};

const char* verdict_name(Verdict verdict);

class CommandPolicy {
public:
    // Built-in rule set
    CommandPolicy();

    // Built-in rules plus policy.blocked_commands / policy.dangerous_patterns
    explicit CommandPolicy(const Config& cfg);

    Classification classify(const std::string& command) const;

    // Returns false (rule ignored) for an empty pattern or a bad regex
    bool add_rule(const PolicyRule& rule);
    const std::vector<PolicyRule>& rules() const { return rules_; }

    // Lowercased, whitespace-collapsed command text
    static std::string normalize(const std::string& command);

    // Split on ; && || | and newlines (quotes are not interpreted)
    static std::vector<std::string> split_segments(const std::string& normalized);

private:
    void add_default_rules();

    // Words of a segment starting at the command word: leading VAR=value
    // assignments and wrappers (sudo, env, nohup, ...) are skipped
    static std::vector<std::string> command_words(const std::string& segment);

    // rm with recursive+force flags; sets `root_target` when one of the
    // operands is a filesystem or home root
    static bool is_recursive_force_rm(const std::vector<std::string>& words, bool& root_target);

    static bool matches(const PolicyRule& rule, const std::string& normalized,
                        const std::vector<std::string>& segments);

    std::vector<PolicyRule> rules_;
};

} // namespace toolgate

#endif // toolgate_CORE_COMMAND_POLICY_HPP
