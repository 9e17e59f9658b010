#pragma once

#include <string>
#include <vector>

namespace judgecell {

/**
 * @brief 支持的编程语言
 * 每种语言的文件扩展名、编译器、编译选项、运行命令、是否需要编译都是固定的，
 * 由下面的函数给出，提交和评测任务中不单独保存这些信息。
 */
enum class language {
    C,
    CPP,
    CPP11,
    CPP14,
    CPP17,
    CPP20,
    PYTHON2,
    PYTHON3,
    JAVA,
    RUST,
    GO,
    JAVASCRIPT,
    TYPESCRIPT
};

/**
 * @brief 源代码文件扩展名，如 "cpp"
 */
const char *file_extension(language lang);

/**
 * @brief 默认的编译器或解释器，如 "g++"、"python3"
 */
const char *default_compiler(language lang);

bool needs_compilation(language lang);

/**
 * @brief 默认编译选项，不需要编译的语言返回空列表
 */
std::vector<std::string> default_compile_flags(language lang);

/**
 * @brief 默认运行命令，如 "./a.out"、"python3"
 * 以 "./" 开头的命令表示编译产物，位于沙箱内的 /program 目录下
 */
const char *default_runtime(language lang);

/**
 * @brief 用于展示的语言名称，如 "C++17"、"Python 3"
 */
const char *display_name(language lang);

/**
 * @brief 语言在 JSON 中的名称，如 "Cpp17"、"Python3"
 */
const char *get_serial_name(language lang);

/**
 * @throw std::invalid_argument 名称无法识别
 */
language parse_language(const std::string &name);

/**
 * @brief 源代码文件名，Java 为 Main.java，其余语言为 main.<扩展名>
 */
std::string source_filename(language lang);

/**
 * @brief 生成沙箱内的编译命令，编译时工作目录为 program_dir
 * @param lang 语言
 * @param flags 编译选项
 * @param program_dir 沙箱内存放源代码和编译产物的目录
 * @return 编译命令的 argv，不需要编译的语言返回空列表
 */
std::vector<std::string> compile_command(language lang, const std::vector<std::string> &flags, const std::string &program_dir);

/**
 * @brief 生成沙箱内的运行命令
 * @param lang 语言
 * @param runtime_args 追加给用户程序的参数
 * @param program_dir 沙箱内存放源代码和编译产物的目录
 * @return 运行命令的 argv
 */
std::vector<std::string> run_command(language lang, const std::vector<std::string> &runtime_args, const std::string &program_dir);

}  // namespace judgecell
