// ShellSage main: ask / run / install
#include <shellsage/ai/llm.hpp>
#include <shellsage/config/settings.hpp>
#include <shellsage/context/error_context.hpp>
#include <shellsage/context/history.hpp>
#include <shellsage/exec/process.hpp>
#include <shellsage/log/logger.hpp>
#include <shellsage/parse/sections.hpp>
#include <shellsage/pipeline/command_generator.hpp>
#include <shellsage/pipeline/error_analyzer.hpp>
#include <shellsage/safety/safety_filter.hpp>
#include <shellsage/util/strings.hpp>

#include <curl/curl.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

using namespace shellsage;

static bool g_color = true;

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }
static std::string apply_color(const std::string& s, const char* code){ if(!g_color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

static void print_usage() {
    std::cout << apply_color("ShellSage","1;36") << " - terminal assistant for command generation and error analysis\n\n"
              << "Usage:\n"
              << "  shellsage ask [--execute] <query...>         generate a command for a request\n"
              << "  shellsage run <command...>                   run a command and diagnose a failure\n"
              << "  shellsage run --analyze --exit-code N <cmd>  diagnose a command that already failed (shell hook)\n"
              << "  shellsage install                            print the bash hook\n\n"
              << "Options:\n"
              << "  -d, --debug   debug logging on stderr (also SHELLSAGE_DEBUG=1)\n"
              << "  -h, --help    show this help\n\n"
              << "Settings are read from ./.env and ~/.shellsagerc, then the environment:\n"
              << "  MODE=local|api  LOCAL_MODEL  OLLAMA_HOST  ACTIVE_API_PROVIDER  API_MODEL  <PROVIDER>_API_KEY\n"
              << "  SHELLSAGE_TIMEOUT  SHELLSAGE_STUB_FILE\n";
}

static std::string join_args(const std::vector<std::string>& args, size_t from) {
    std::string out;
    for (size_t i=from;i<args.size();++i) { if (!out.empty()) out += ' '; out += args[i]; }
    return out;
}

static void seed_history(CommandHistory& history) {
    std::string histfile = getenv_or("HISTFILE");
    if (histfile.empty()) { std::string home = getenv_or("HOME"); if (!home.empty()) histfile = home + "/.bash_history"; }
    if (!histfile.empty()) history.load_file(histfile);
}

static bool read_answer(const std::string& prompt, std::string& answer) {
    std::cout << prompt << std::flush;
    if (!std::getline(std::cin, answer)) { std::cout << '\n'; return false; }
    answer = to_lower(trim(answer));
    return true;
}

static void render_generation(const GenerationResult& result) {
    std::cout << '\n' << apply_color("COMMAND ANALYSIS","1;36") << '\n';
    std::string command;
    bool has_command = false;
    for (auto &rec : to_records(result)) {
        std::string content = rec.content.value_or("");
        if (rec.type == "thinking") std::cout << apply_color("› " + content, "2;33") << '\n';
        else if (rec.type == "analysis") std::cout << apply_color("ⓘ " + content, "36") << '\n';
        else if (rec.type == "warning") std::cout << apply_color("⚠ " + content, "31") << '\n';
        else if (rec.type == "details") std::cout << apply_color(content, "2") << '\n';
        else if (rec.type == "command" && rec.content) { command = content; has_command = true; }
    }
    if (has_command) std::cout << '\n' << apply_color("Generated Command:","32") << ' ' << apply_color(command,"1;32") << '\n';
    else std::cout << '\n' << apply_color("No valid command generated","31") << '\n';
}

static void render_diagnosis(const DiagnosisResult& result, const ErrorContext& ctx) {
    std::cout << '\n' << apply_color("Error Analysis","1;36") << '\n';
    if (result.failure) { std::cout << apply_color(*result.failure, "91") << '\n'; return; }
    for (auto &t : result.thoughts) std::cout << apply_color("› " + t, "2;33") << '\n';
    if (!ctx.history.empty()) {
        std::cout << apply_color("Recent Commands","37") << '\n';
        size_t from = ctx.history.size() > 3 ? ctx.history.size() - 3 : 0;
        for (size_t i=from;i<ctx.history.size();++i) std::cout << apply_color("  › " + ctx.history[i], "2") << '\n';
    }
    if (!ctx.relevant_files.empty()) {
        std::cout << apply_color("Related Files","37") << '\n';
        for (auto &f : ctx.relevant_files) std::cout << apply_color("  › " + f, "2") << '\n';
    }
    if (!ctx.man_excerpt.empty() && !contains(ctx.man_excerpt, "No manual entry"))
        std::cout << apply_color("📘 Manual Reference","1;34") << '\n' << ctx.man_excerpt << '\n';
    if (result.empty()) { std::cout << apply_color("Error: Could not get analysis","91") << '\n'; return; }
    auto block = [](const char* title, const char* code, const std::optional<std::string>& v) {
        if (!v) return;
        std::cout << '\n' << apply_color(title, code) << '\n' << *v << '\n';
    };
    block("Root Cause", "1;36", result.cause);
    block("Technical Explanation", "1;36", result.explanation);
    if (result.fix) std::cout << '\n' << apply_color("⚡ Recommended Fix","1;92") << '\n' << apply_color(*result.fix,"92") << '\n';
    block("Potential Risks", "1;33", result.risk);
    block("Prevention Tip", "1;33", result.prevention);
}

static int cmd_ask(const std::vector<std::string>& args, size_t from, ai::LLMClient& llm) {
    bool execute = false;
    std::vector<std::string> words;
    for (size_t i=from;i<args.size();++i) {
        if (args[i] == "--execute") execute = true; else words.push_back(args[i]);
    }
    std::string query = join_args(words, 0);
    if (trim(query).empty()) { std::cerr << "shellsage ask: missing query\n"; return 2; }
    CommandHistory history; seed_history(history);
    GenerationContext ctx = collect_generation_context(history);
    CommandGenerator generator(llm);
    GenerationResult result = generator.generate(query, ctx);
    render_generation(result);
    if (!result.command) return 1;
    if (!execute) return 0;
    std::string answer;
    if (!read_answer("\n" + apply_color("› Execute command?","1;33") + " [[y]/n]: ", answer) || answer == "n" || answer == "no") return 0;
    if (requires_confirmation(*result.command)) {
        if (!read_answer(apply_color("This command may be destructive. Type 'yes' to run it: ","1;31"), answer) || answer != "yes") {
            std::cout << "Cancelled.\n";
            return 0;
        }
    }
    return run_shell_interactive(*result.command);
}

static void diagnose(const std::string& command, const std::string& output, int exit_code,
                    const CommandHistory& history, ai::LLMClient& llm) {
    ErrorContext ctx = collect_error_context(command, output, exit_code, history);
    std::cout << '\n' << apply_color("🔎 Analyzing error...","90") << '\n';
    ErrorAnalyzer analyzer(llm);
    DiagnosisResult result = analyzer.analyze(ctx);
    render_diagnosis(result, ctx);
}

static int cmd_run(const std::vector<std::string>& args, size_t from, ai::LLMClient& llm) {
    bool analyze = false;
    int exit_code = 1;
    std::vector<std::string> words;
    for (size_t i=from;i<args.size();++i) {
        if (args[i] == "--analyze") { analyze = true; continue; }
        if (args[i] == "--exit-code") {
            if (i+1 >= args.size()) { std::cerr << "shellsage run: --exit-code needs a value\n"; return 2; }
            try { exit_code = std::stoi(args[++i]); }
            catch (const std::exception&) { std::cerr << "shellsage run: invalid exit code '" << args[i] << "'\n"; return 2; }
            continue;
        }
        words.push_back(args[i]);
    }
    std::string command = join_args(words, 0);
    if (trim(command).empty()) { std::cerr << "shellsage run: missing command\n"; return 2; }
    CommandHistory history; seed_history(history);
    history.push(command);
    if (analyze) {
        // Shell hook: the command already ran; re-run it only to recover stderr.
        std::string output;
        if (requires_confirmation(command)) logger()->debug("not re-running '{}' to capture output", command);
        else output = run_shell_capture(command).err;
        diagnose(command, output, exit_code, history, llm);
        return exit_code;
    }
    CaptureResult r = run_shell_capture(command, true);
    std::cout << r.out << std::flush;
    std::cerr << r.err << std::flush;
    if (r.exit_code != 0) {
        std::string output = r.err;
        if (!r.out.empty()) output += "\n" + r.out;
        diagnose(command, output, r.exit_code, history, llm);
    }
    return r.exit_code;
}

static int cmd_install() {
    std::cout << "# Add this to your shell config:\n"
              << "shell_sage_prompt() {\n"
              << "    local EXIT=$?\n"
              << "    local CMD=$(fc -ln -1 | awk '{$1=$1}1' | sed 's/\\\\/\\\\\\\\/g')\n"
              << "    [ $EXIT -ne 0 ] && shellsage run --analyze \"$CMD\" --exit-code $EXIT\n"
              << "    history -s \"$CMD\"\n"
              << "}\n"
              << "PROMPT_COMMAND=\"shell_sage_prompt\"\n\n"
              << "# Then run: source ~/.bashrc\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    bool debug = false;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if (args.empty() && (a == "--debug" || a == "-d")) { debug = true; continue; }
        if (args.empty() && (a == "--help" || a == "-h")) { print_usage(); return 0; }
        args.push_back(a);
    }
    g_color = getenv_or("NO_COLOR").empty() && isatty(STDOUT_FILENO);
    Settings settings = load_settings();
    init_logging(debug || settings.debug);
    if (args.empty()) { print_usage(); return 2; }

    const std::string& sub = args[0];
    if (sub == "install") return cmd_install();
    if (sub != "ask" && sub != "run") {
        std::cerr << "shellsage: unknown command '" << sub << "'\n";
        print_usage();
        return 2;
    }
    curl_global_init(CURL_GLOBAL_DEFAULT);
    auto llm = ai::make_llm(to_llm_config(settings));
    int rc = sub == "ask" ? cmd_ask(args, 1, *llm) : cmd_run(args, 1, *llm);
    curl_global_cleanup();
    return rc;
}
