#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "ai/retry_policy.hpp"

namespace kata {

/**
 * @brief 支持的模型
 */
extern const std::vector<std::string> SUPPORTED_MODELS;

/**
 * @brief AI 评分客户端的配置
 */
struct ai_config {
    /**
     * @brief API key，从 OPENAI_API_KEY 或 OPENAI_API_TOKEN 环境变量读取
     * 为空时所有 AI 调用直接返回 auth 错误，不会发出请求
     */
    std::string api_key;

    /**
     * @brief 兼容 OpenAI chat completions 接口的服务地址，请求发往 base_url/chat/completions
     */
    std::string base_url = "https://api.openai.com/v1";

    std::string model = "gpt-4o-mini";
    double temperature = 0.3;
    int max_tokens = 2000;

    /**
     * @brief 单次请求的超时时间，超时的请求按 timeout 错误处理并重试
     */
    std::chrono::milliseconds timeout{60000};

    retry_config retry;
};

/**
 * @brief 引擎配置，启动时构造一次并传给 engine
 * 优先级：命令行参数 > 环境变量 > 配置文件 > 默认值
 */
struct engine_config {
    /**
     * @brief 存放工作目录的路径，每次执行在其中创建一个随机命名的子目录
     *
     * run_dir
     * └── 2f1c...-uuid // 一次执行的工作目录
     *     ├── entry.py // 选手代码
     *     ├── tests.py // 公开测试
     *     ├── hidden_tests.py // 隐藏测试，仅当 include_hidden 时存在
     *     ├── kata_runner.py // 引擎生成的测试驱动
     *     └── .kata_report.jsonl // 测试驱动输出的测试结果
     */
    std::filesystem::path run_dir = std::filesystem::temp_directory_path() / "kata-engine";

    /**
     * @brief 并发执行的 worker 数量
     */
    size_t workers = 2;

    /**
     * @brief 调试模式下不删除工作目录，以便检查测试驱动的输出
     */
    bool debug = false;

    /**
     * @brief 执行请求和题目元数据都没有指定时间限制时使用
     */
    std::chrono::milliseconds default_timeout{5000};

    /**
     * @brief 编译步骤（g++、tsc）的时间限制，与运行时间限制分开计算
     */
    std::chrono::milliseconds compile_timeout{30000};

    std::chrono::milliseconds probe_timeout{3000};

    /**
     * @brief 超时后 SIGTERM 与 SIGKILL 之间的等待时间
     */
    std::chrono::milliseconds kill_grace{200};

    /**
     * @brief stdout、stderr 各自最多保留的字节数，超出部分被丢弃并标记截断
     */
    int64_t output_limit = 1 << 20;

    ai_config ai;
};

void from_json(const nlohmann::json &j, ai_config &config);
void from_json(const nlohmann::json &j, engine_config &config);

/**
 * @brief 读取 JSON 格式的配置文件，没有出现的字段保持默认值
 * @throw std::invalid_argument 配置文件无法解析
 */
engine_config load_engine_config(const std::filesystem::path &config_file);

/**
 * @brief 使用环境变量覆盖配置
 * OPENAI_API_KEY/OPENAI_API_TOKEN、OPENAI_BASE_URL、KATA_MODEL、KATA_RUN_DIR、KATA_WORKERS、KATA_DEBUG
 */
void apply_environment(engine_config &config);

/**
 * @brief 检查 AI 配置是否合法
 * @return 所有不合法项的描述，合法时为空
 */
std::vector<std::string> validate_ai_config(const ai_config &config);

}  // namespace kata
