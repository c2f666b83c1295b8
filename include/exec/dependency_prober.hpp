#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "exec/language.hpp"
#include "exec/sandbox.hpp"

namespace kata {

/**
 * @brief 单个工具链的探测结果
 */
struct dependency_status {
    std::string name;
    bool available = false;
    std::optional<std::string> version;
    std::optional<std::string> error;
    std::optional<std::string> installation_guide;

    /**
     * @brief 探测成功的命令，比如 python3 或 python、g++ 或 clang++，
     * 语言适配器使用该命令运行选手代码
     */
    std::string command;
};

/**
 * @brief 所有工具链的探测结果快照，创建后不再修改
 */
struct system_dependencies {
    dependency_status python;
    dependency_status nodejs;
    dependency_status typescript;
    dependency_status cpp;

    /**
     * @brief 所有工具链都可用
     */
    bool all_available = false;

    /**
     * @brief 检查运行某种语言所需的工具链
     * TypeScript 同时需要 Node.js 和 tsc
     * @return 工具链不可用时返回不可用的那一项，否则为空
     */
    const dependency_status *missing_toolchain(language lang) const;
};

/**
 * @brief 探测本机的语言工具链
 * 探测结果缓存在内存中，只有显式调用 refresh 才会重新探测。
 * 刷新时构造一个新的快照再整体替换指针，读者拿到的快照不会被修改，
 * 因此不会读到一半新一半旧的结果。
 */
struct dependency_prober {
    dependency_prober(sandbox &sb, std::chrono::milliseconds probe_timeout);

    /**
     * @brief 返回缓存的探测结果，没有缓存时先探测一次
     */
    std::shared_ptr<const system_dependencies> probe();

    /**
     * @brief 重新探测所有工具链并替换缓存
     */
    std::shared_ptr<const system_dependencies> refresh();

    /**
     * @brief 当前缓存，还没有探测过时为空
     */
    std::shared_ptr<const system_dependencies> cached() const;

private:
    system_dependencies probe_all();
    dependency_status probe_python();
    dependency_status probe_nodejs();
    dependency_status probe_typescript();
    dependency_status probe_cpp();

    /**
     * @brief 执行版本查询命令
     * @param output 保存 stdout 和 stderr 的内容
     * @param error 命令失败时保存原因
     * @return 命令是否成功运行并返回 0
     */
    bool query(const std::vector<std::string> &command, std::string &output, std::string &error);

    sandbox &sb;
    std::chrono::milliseconds probe_timeout;
    std::mutex refresh_mutex;
    std::shared_ptr<const system_dependencies> cache;
};

}  // namespace kata
