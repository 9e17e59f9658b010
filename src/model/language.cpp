#include "judgecell/model/language.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <stdexcept>

namespace judgecell {
using namespace std;

struct language_facts {
    language lang;
    const char *serial;
    const char *display;
    const char *extension;
    const char *compiler;
    const char *runtime;
    const char *standard;  // C++ 的 -std 选项
};

// clang-format off
static const language_facts catalogue[] = {
    {language::C,          "C",          "C",          "c",    "gcc",     "./a.out", nullptr},
    {language::CPP,        "Cpp",        "C++",        "cpp",  "g++",     "./a.out", "-std=c++11"},
    {language::CPP11,      "Cpp11",      "C++11",      "cpp",  "g++",     "./a.out", "-std=c++11"},
    {language::CPP14,      "Cpp14",      "C++14",      "cpp",  "g++",     "./a.out", "-std=c++14"},
    {language::CPP17,      "Cpp17",      "C++17",      "cpp",  "g++",     "./a.out", "-std=c++17"},
    {language::CPP20,      "Cpp20",      "C++20",      "cpp",  "g++",     "./a.out", "-std=c++20"},
    {language::PYTHON2,    "Python2",    "Python 2",   "py",   "python2", "python2", nullptr},
    {language::PYTHON3,    "Python3",    "Python 3",   "py",   "python3", "python3", nullptr},
    {language::JAVA,       "Java",       "Java",       "java", "javac",   "java",    nullptr},
    {language::RUST,       "Rust",       "Rust",       "rs",   "rustc",   "./main",  nullptr},
    {language::GO,         "Go",         "Go",         "go",   "go",      "./main",  nullptr},
    {language::JAVASCRIPT, "JavaScript", "JavaScript", "js",   "node",    "node",    nullptr},
    {language::TYPESCRIPT, "TypeScript", "TypeScript", "ts",   "ts-node", "ts-node", nullptr},
};
// clang-format on

static const language_facts &facts(language lang) {
    for (auto &item : catalogue)
        if (item.lang == lang) return item;
    throw invalid_argument("Unrecognized language " + std::to_string(static_cast<int>(lang)));
}

const char *file_extension(language lang) {
    return facts(lang).extension;
}

const char *default_compiler(language lang) {
    return facts(lang).compiler;
}

bool needs_compilation(language lang) {
    switch (lang) {
        case language::C:
        case language::CPP:
        case language::CPP11:
        case language::CPP14:
        case language::CPP17:
        case language::CPP20:
        case language::JAVA:
        case language::RUST:
        case language::GO:
            return true;
        default:
            return false;
    }
}

vector<string> default_compile_flags(language lang) {
    switch (lang) {
        case language::C:
            return {"-O2", "-Wall"};
        case language::CPP:
        case language::CPP11:
        case language::CPP14:
        case language::CPP17:
        case language::CPP20:
            return {"-O2", "-Wall", facts(lang).standard};
        case language::JAVA:
            return {"-Xlint:all"};
        case language::RUST:
            return {"-O"};
        default:
            return {};
    }
}

const char *default_runtime(language lang) {
    return facts(lang).runtime;
}

const char *display_name(language lang) {
    return facts(lang).display;
}

const char *get_serial_name(language lang) {
    return facts(lang).serial;
}

language parse_language(const string &name) {
    for (auto &item : catalogue)
        if (name == item.serial) return item.lang;
    throw invalid_argument("Unrecognized language " + name);
}

string source_filename(language lang) {
    if (lang == language::JAVA) return "Main.java";
    return string("main.") + file_extension(lang);
}

vector<string> compile_command(language lang, const vector<string> &flags, const string &program_dir) {
    if (!needs_compilation(lang)) return {};

    vector<string> argv;
    string source = program_dir + "/" + source_filename(lang);
    switch (lang) {
        case language::GO:
            argv = {default_compiler(lang), "build"};
            argv.insert(argv.end(), flags.begin(), flags.end());
            argv.insert(argv.end(), {"-o", program_dir + "/main", source});
            break;
        case language::JAVA:
            argv = {default_compiler(lang)};
            argv.insert(argv.end(), flags.begin(), flags.end());
            argv.insert(argv.end(), {"-d", program_dir, source});
            break;
        case language::RUST:
            argv = {default_compiler(lang)};
            argv.insert(argv.end(), flags.begin(), flags.end());
            argv.insert(argv.end(), {"-o", program_dir + "/main", source});
            break;
        default:  // C/C++
            argv = {default_compiler(lang)};
            argv.insert(argv.end(), flags.begin(), flags.end());
            argv.insert(argv.end(), {source, "-o", program_dir + "/a.out"});
            break;
    }
    return argv;
}

vector<string> run_command(language lang, const vector<string> &runtime_args, const string &program_dir) {
    vector<string> argv;
    string runtime = default_runtime(lang);
    if (boost::starts_with(runtime, "./")) {
        argv.push_back(program_dir + runtime.substr(1));
    } else if (lang == language::JAVA) {
        argv = {runtime, "-cp", program_dir, "Main"};
    } else {
        argv = {runtime, program_dir + "/" + source_filename(lang)};
    }
    argv.insert(argv.end(), runtime_args.begin(), runtime_args.end());
    return argv;
}

}  // namespace judgecell
