//===----------------------------------------------------------------------===//
//                         IOM Client
//
// session/submission.hpp
//
// Program submission: output capture, macro injection, log and listing
// retrieval, and the unconditional parser reset
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/session_config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace iomclient {

enum class ResultFormat {
    HTML,   // captured through an output destination file
    TEXT    // plain listing channel
};

// Solicits macro-variable values from the user. Returns nullopt when the
// user cancels.
class Prompter {
public:
    virtual ~Prompter() = default;
    virtual std::optional<std::string> Prompt(const std::string& message, bool hide) = 0;
};

struct MacroPrompt {
    std::string name;
    bool hidden = false;
};

struct SubmitResult {
    std::string log;
    std::string listing;
};

class SubmissionEngine {
public:
    // Terminates any open quote, comment, or step left by earlier input
    static constexpr const char* RESET_SENTINEL = ";*';*\";*/;quit;run;";
    static constexpr const char* CAPTURE_ID = "iom_internal";

    explicit SubmissionEngine(Session& session_p, std::shared_ptr<Prompter> prompter_p = nullptr);

    // Submit code and return this call's log and listing. The parser is
    // reset afterwards whether or not the submission succeeded. Throws
    // PromptCancelled if any prompt is cancelled; nothing is submitted then.
    SubmitResult Submit(const std::string& code,
                        ResultFormat format = ResultFormat::HTML,
                        const std::vector<MacroPrompt>& prompts = {});

    // Submit framed code without retrieving log or listing
    void SubmitAsync(const std::string& code, ResultFormat format = ResultFormat::HTML);

    // Sentinel, macro declarations, optionally wrapped code, sentinel.
    // `result_file` is the capture destination for HTML output.
    std::string FrameProgram(const std::string& code, ResultFormat format,
                             const std::string& macro_preamble,
                             const std::string& result_file) const;

    // Remote WORK directory including its trailing separator
    const std::string& WorkPath();
    char HostSeparator();

    std::string ResultFilePath();

    void SetPrompter(std::shared_ptr<Prompter> prompter_p) { prompter = std::move(prompter_p); }

    static std::string ApplyFixups(std::string text, const std::vector<OutputFixup>& fixups);
    static bool LogHasErrors(const std::string& log);

private:
    std::string BuildMacroPreamble(const std::vector<MacroPrompt>& prompts);
    std::string CaptureOpen(const std::string& result_file) const;
    std::string CaptureClose() const;

private:
    Session& session;
    std::shared_ptr<Prompter> prompter;
    std::optional<std::string> work_path;
};

} // namespace iomclient
