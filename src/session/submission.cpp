//===----------------------------------------------------------------------===//
//                         IOM Client
//
// session/submission.cpp
//
// Submission engine implementation
//===----------------------------------------------------------------------===//

#include "session/submission.hpp"
#include "session/session.hpp"
#include "logging/logger.hpp"
#include <sstream>

namespace iomclient {

namespace {

constexpr const char* WORKPATH_MARKER = "IOMWORKPATH=";

// Resets the language service when the submission scope ends, on every
// exit path. A parser left mid-statement rejects all later input.
class ParserResetScope {
public:
    explicit ParserResetScope(Session& session_p) : session(session_p) {}

    ~ParserResetScope() {
        try {
            session.ResetParser();
        } catch (const std::exception& e) {
            LOG_ERROR("submit", std::string("Language service reset failed: ") + e.what());
        }
    }

    ParserResetScope(const ParserResetScope&) = delete;
    ParserResetScope& operator=(const ParserResetScope&) = delete;

private:
    Session& session;
};

std::string TrimRight(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\r' || s.back() == '\t')) {
        s.pop_back();
    }
    return s;
}

} // anonymous namespace

SubmissionEngine::SubmissionEngine(Session& session_p, std::shared_ptr<Prompter> prompter_p)
    : session(session_p)
    , prompter(std::move(prompter_p)) {
}

std::string SubmissionEngine::BuildMacroPreamble(const std::vector<MacroPrompt>& prompts) {
    std::string preamble;
    for (const auto& prompt : prompts) {
        if (!prompter) {
            throw PromptCancelled("No prompter available for macro variable " + prompt.name);
        }

        std::string value;
        while (value.empty()) {
            auto answer = prompter->Prompt("Enter value for macro variable " + prompt.name + " ",
                                           prompt.hidden);
            if (!answer) {
                throw PromptCancelled("Prompt for macro variable " + prompt.name + " was cancelled");
            }
            value = *answer;
            if (value.empty()) {
                LOG_WARN("submit", "Input not valid for macro variable " + prompt.name);
            }
        }
        preamble += "%let " + prompt.name + " = " + value + ";\n";
    }
    return preamble;
}

std::string SubmissionEngine::CaptureOpen(const std::string& result_file) const {
    const auto& config = session.GetConfig();
    std::ostringstream out;
    out << "\nods listing close;\n"
        << "ods " << config.output << " (id=" << CAPTURE_ID << ") options(bitmap_mode='inline')\n"
        << "    file=\"" << result_file << "\"\n"
        << "    device=svg\n"
        << "    style=" << config.html_style << ";\n"
        << "ods graphics on / outputfmt=png;\n";
    return out.str();
}

std::string SubmissionEngine::CaptureClose() const {
    const auto& config = session.GetConfig();
    return "\nods " + config.output + " (id=" + CAPTURE_ID + ") close;\nods listing;\n";
}

std::string SubmissionEngine::FrameProgram(const std::string& code, ResultFormat format,
                                           const std::string& macro_preamble,
                                           const std::string& result_file) const {
    std::string body = code;
    if (format == ResultFormat::HTML) {
        body = CaptureOpen(result_file) + code + CaptureClose();
    }
    return std::string(RESET_SENTINEL) + "\n" + macro_preamble + body + "\n" + RESET_SENTINEL + "\n";
}

SubmitResult SubmissionEngine::Submit(const std::string& code, ResultFormat format,
                                      const std::vector<MacroPrompt>& prompts) {
    // Prompts and the capture path are settled before anything is sent
    std::string macros = BuildMacroPreamble(prompts);
    std::string result_file = format == ResultFormat::HTML ? ResultFilePath() : "";

    SubmitResult result;
    {
        ParserResetScope reset(session);
        session.Submit(FrameProgram(code, format, macros, result_file));

        result.log = session.FlushLog();
        if (format == ResultFormat::HTML) {
            result.listing = ApplyFixups(session.ReadRemoteFile(result_file),
                                         session.GetConfig().output_fixups);
        } else {
            result.listing = session.FlushListing();
        }
    }

    // Recorded after the reset; the next submission's reset clears it
    if (LogHasErrors(result.log)) {
        session.MarkError();
    }
    return result;
}

void SubmissionEngine::SubmitAsync(const std::string& code, ResultFormat format) {
    std::string result_file = format == ResultFormat::HTML ? ResultFilePath() : "";
    session.Submit(FrameProgram(code, format, "", result_file));
}

const std::string& SubmissionEngine::WorkPath() {
    if (work_path) {
        return *work_path;
    }

    auto result = Submit(std::string("%put ") + WORKPATH_MARKER + "%sysfunc(pathname(work));",
                         ResultFormat::TEXT);

    std::istringstream lines(result.log);
    std::string line;
    std::string path;
    while (std::getline(lines, line)) {
        if (line.compare(0, std::char_traits<char>::length(WORKPATH_MARKER), WORKPATH_MARKER) == 0) {
            path = TrimRight(line.substr(std::char_traits<char>::length(WORKPATH_MARKER)));
        }
    }
    if (path.empty()) {
        throw std::runtime_error("Could not determine the remote WORK path from the log");
    }

    char sep = path.find('\\') != std::string::npos ? '\\' : '/';
    if (path.back() != sep) {
        path += sep;
    }
    work_path = path;
    LOG_DEBUG("submit", "Remote WORK path is " + path);
    return *work_path;
}

char SubmissionEngine::HostSeparator() {
    const auto& path = WorkPath();
    return path.find('\\') != std::string::npos ? '\\' : '/';
}

std::string SubmissionEngine::ResultFilePath() {
    return WorkPath() + RESULT_HTML_FILE;
}

std::string SubmissionEngine::ApplyFixups(std::string text, const std::vector<OutputFixup>& fixups) {
    for (const auto& fixup : fixups) {
        if (fixup.from.empty()) {
            continue;
        }
        size_t pos = 0;
        while ((pos = text.find(fixup.from, pos)) != std::string::npos) {
            text.replace(pos, fixup.from.size(), fixup.to);
            pos += fixup.to.size();
        }
    }
    return text;
}

bool SubmissionEngine::LogHasErrors(const std::string& log) {
    std::istringstream lines(log);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, 5, "ERROR") == 0) {
            return true;
        }
    }
    return false;
}

} // namespace iomclient
