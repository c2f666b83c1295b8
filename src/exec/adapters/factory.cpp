#include "common/stl_utils.hpp"
#include "exec/adapters.hpp"

namespace kata {
using namespace std;

// 探测结果中的命令优先于默认值，比如只有 python 没有 python3 的系统
static string command_or(const dependency_status &status, const string &def) {
    return status.command.empty() ? def : status.command;
}

adapter_config make_adapter_config(language lang, const system_dependencies &deps) {
    switch (lang) {
        case language::PYTHON: {
            python_config config;
            config.interpreter = command_or(deps.python, config.interpreter);
            return config;
        }
        case language::JAVASCRIPT: {
            javascript_config config;
            config.node = command_or(deps.nodejs, config.node);
            return config;
        }
        case language::TYPESCRIPT: {
            typescript_config config;
            config.node = command_or(deps.nodejs, config.node);
            config.compiler = command_or(deps.typescript, config.compiler);
            return config;
        }
        case language::CPP: {
            cpp_config config;
            config.compiler = command_or(deps.cpp, config.compiler);
            return config;
        }
    }
    throw invalid_argument("unsupported language " + std::to_string(static_cast<int>(lang)));
}

unique_ptr<language_adapter> make_adapter(const adapter_config &config) {
    return visit(overloaded{
                     [](const python_config &c) -> unique_ptr<language_adapter> { return make_unique<python_adapter>(c); },
                     [](const javascript_config &c) -> unique_ptr<language_adapter> { return make_unique<javascript_adapter>(c); },
                     [](const typescript_config &c) -> unique_ptr<language_adapter> { return make_unique<typescript_adapter>(c); },
                     [](const cpp_config &c) -> unique_ptr<language_adapter> { return make_unique<cpp_adapter>(c); }},
                 config);
}

}  // namespace kata
