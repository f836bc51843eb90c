/**
 * @file TendencyStatements.cpp
 * @brief Statement tables for learned tendencies.
 */

#include "application/capsule/TendencyStatements.hpp"
#include <algorithm>
#include <map>
#include <utility>
#include <vector>

namespace reflectcore::application::capsule {

using domain::learning::PatternKind;

namespace {

using StatementTable = std::map<std::string, std::string>;

std::string Humanise(std::string raw) {
    std::replace(raw.begin(), raw.end(), '_', ' ');
    return raw;
}

std::string Lookup(const StatementTable& table, const std::string& key, const std::string& fallback) {
    auto it = table.find(key);
    return it != table.end() ? it->second : fallback;
}

std::string TopicStatement(const std::string& key) {
    static const std::vector<std::pair<std::string, std::string>> prefixes = {
        {"topic:", "Topic: "},
        {"profile:language:", "Language: "},
        {"profile:country:", "Country: "},
        {"profile:region:", "Region: "},
        {"profile:age_band:", "Age band: "},
        {"profile:age_decade:", "Age: "}
    };
    for (const auto& [prefix, label] : prefixes) {
        if (key.rfind(prefix, 0) == 0) {
            return label + Humanise(key.substr(prefix.size()));
        }
    }
    return "Noted: " + Humanise(key);
}

} // namespace

std::string StatementFor(PatternKind kind, const std::string& key) {
    const std::string k = Humanise(key);

    switch (kind) {
        case PatternKind::StylePreference: {
            static const StatementTable table = {
                {"bullets", "Prefers bullet points"},
                {"concise", "Prefers concise summaries"},
                {"scripted_reply", "Often wants suggested wording"},
                {"prefers_tldr_then_detail", "Prefers TL;DR first, then details"},
                {"prefers_brief", "Prefers brief answers"},
                {"prefers_numbered_steps", "Prefers numbered steps"},
                {"prefers_checklist", "Prefers checklists"},
                {"prefers_decision_tree", "Prefers decision trees"},
                {"prefers_no_fluff", "Prefers direct, no-fluff replies"}
            };
            return Lookup(table, key, "Prefers " + k);
        }
        case PatternKind::WorkflowPreference: {
            static const StatementTable table = {
                {"options_first", "Wants options before questions"},
                {"prefers_confirm_then_execute", "Prefers to confirm once, then proceed"},
                {"prefers_execute_immediately", "Prefers to execute without preamble"},
                {"prefers_just_answer", "Prefers a direct answer"},
                {"prefers_few_questions", "Prefers fewer questions"},
                {"prefers_no_clarifying_questions", "Prefers no clarifying questions"},
                {"question_light", "Prefers lighter questioning"},
                {"question_guided", "Prefers guided questioning"},
                {"narrow_first", "Prefers one path first"},
                {"explore_space", "Prefers exploring options"}
            };
            return Lookup(table, key, "Often wants " + k);
        }
        case PatternKind::TopicRecurrence:
            return TopicStatement(key);
        case PatternKind::ResolutionPattern: {
            static const StatementTable table = {
                {"constraints_first", "Responds better when constraints are addressed early"},
                {"decision_stuck", "Gets stuck deciding under uncertainty"},
                {"needs_decompression", "Responds better after decompressing first"},
                {"complexity_high", "Often faces high complexity"},
                {"prefers_reframe_then_steps", "Responds better with a reframe before steps"}
            };
            return Lookup(table, key, "Responds better when " + k);
        }
        case PatternKind::ConstraintsSensitivity: {
            static const StatementTable table = {
                {"time_pressure", "Often constrained by time pressure"},
                {"low_energy", "Often constrained by low energy"},
                {"money_limit", "Often constrained by money limits"},
                {"social_overload", "Often constrained by social factors"},
                {"dependency_blocked", "Often constrained by dependencies"},
                {"sensory_noise", "Sensitive to sensory overload"},
                {"legal_risk", "Often constrained by legal risk"}
            };
            return Lookup(table, key, "Often constrained by " + k);
        }
        case PatternKind::NarrativePattern: {
            static const StatementTable table = {
                {"replay_loop", "Tends to replay the story"},
                {"identity_frame_present", "Framing often involves identity"},
                {"outcome_fixation", "Fixates on a single outcome"},
                {"control_frame", "Framing leans toward control"},
                {"uncertainty_pressure", "Feels pressure from uncertainty"},
                {"self_attack_language", "Uses self-critical language"},
                {"reassurance_checking", "Seeks reassurance"},
                {"avoidance_language", "Uses avoidance language"}
            };
            return Lookup(table, key, "Narrative pattern: " + k);
        }
        case PatternKind::LensPreference: {
            static const StatementTable table = {
                {"softening_helps", "Softening lens tends to help"},
                {"widening_helps", "Widening lens tends to help"},
                {"letting_be_helps", "Letting-be lens tends to help"},
                {"compassionate_witnessing_helps", "Compassionate witnessing tends to help"},
                {"impermanence_helps", "Impermanence lens tends to help"},
                {"non_identification_helps", "Non-identification lens tends to help"}
            };
            return Lookup(table, key, "Lens " + k + " tends to help");
        }
        case PatternKind::ConstraintTrigger: {
            static const StatementTable table = {
                {"trigger:noise", "Often harder in noisy environments"},
                {"trigger:bright_light", "Often harder with bright light"},
                {"trigger:crowds", "Often harder in crowds"},
                {"trigger:group_dynamics", "Often harder with complex group dynamics"},
                {"trigger:hierarchy_games", "Often harder with power dynamics"},
                {"trigger:being_observed", "Often harder when being observed"},
                {"trigger:too_many_variables", "Often harder with many variables"},
                {"trigger:unclear_requirements", "Often harder when requirements are unclear"},
                {"trigger:interruptions", "Often harder with frequent interruptions"},
                {"trigger:context_switching", "Often harder with frequent context switching"},
                {"trigger:deadline_pressure", "Often harder under deadline pressure"},
                {"trigger:low_sleep", "Often harder with low sleep"},
                {"trigger:low_energy", "Often harder with low energy"}
            };
            return Lookup(table, key, "Often harder when " + k);
        }
        case PatternKind::ContractionPattern: {
            static const StatementTable table = {
                {"contraction:identity_fixation", "Identity framing can tighten experience"},
                {"contraction:outcome_fixation", "Outcome fixation can increase pressure"},
                {"contraction:control_pressure", "Control efforts can add pressure"},
                {"contraction:uncertainty_pressure", "Uncertainty can amplify tension"},
                {"contraction:mental_looping", "Mental replay can sustain tightening"},
                {"contraction:self_attack", "Self-critical language can tighten experience"},
                {"contraction:checking_for_reassurance", "Checking for reassurance can sustain tightening"},
                {"contraction:avoidance_pressure", "Avoidance language can increase pressure"}
            };
            return Lookup(table, key, "Tightening can show up under certain conditions");
        }
        case PatternKind::ReleasePattern: {
            static const StatementTable table = {
                {"release:ease_present", "Ease can show up under some conditions"},
                {"release:settling", "Settling can appear at times"},
                {"release:openness", "A sense of space can open when pressure drops"}
            };
            return Lookup(table, key, "Ease can appear under certain conditions");
        }
    }
    return "Noted: " + k;
}

} // namespace reflectcore::application::capsule
