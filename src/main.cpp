#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>
#include "api/messages.hpp"
#include "api/server.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "engine.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    // stdout 只用于输出响应，日志写入 stderr
    FLAGS_logtostderr = true;
    google::InitGoogleLogging(argv[0]);

    // 客户端关闭管道后写 stdout 不应该杀死进程
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("kata-engine options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load engine configuration from the given JSON file")
        ("run-dir", po::value<string>(), "set the directory to create submission workspaces in. You can either pass it from environ KATA_RUN_DIR")
        ("workers", po::value<size_t>(), "set the number of concurrent workers, default to 2. You can either pass it from environ KATA_WORKERS")
        ("serve", "read line-delimited JSON requests from stdin and write responses to stdout")
        ("check-dependencies", "probe language toolchains and print the result")
        ("execute", "run a submission against a kata and print the result")
        ("language", po::value<string>(), "language of the submission: py, js, ts or cpp")
        ("source", po::value<string>(), "path of the submission source file")
        ("kata", po::value<string>(), "path of the kata directory")
        ("hidden", "also run hidden tests")
        ("timeout-ms", po::value<int>(), "time limit of the test run in milliseconds, default to the kata's timeout_ms")
        ("debug", "turn on the debug mode to keep submission workspaces for inspection. You can either pass it from environ KATA_DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "KataEngine: run learner submissions against kata tests and judge free-form answers with an AI model" << endl
             << "Optional Environment Variables:" << endl
             << "\tOPENAI_API_KEY: API key of the completion service used for judging" << endl
             << "\tOPENAI_BASE_URL: base URL of an OpenAI compatible completion service" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "kata-engine 1.0" << endl;
        return EXIT_SUCCESS;
    }

    kata::engine_config config;
    try {
        if (vm.count("config"))
            config = kata::load_engine_config(vm.at("config").as<string>());
        kata::apply_environment(config);
    } catch (std::exception& e) {
        cerr << "Unable to load configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("run-dir"))
        config.run_dir = vm.at("run-dir").as<string>();
    if (vm.count("workers"))
        config.workers = vm.at("workers").as<size_t>();
    if (vm.count("debug"))
        config.debug = true;

    CHECK(config.workers > 0) << "At least one worker is required";

    if (!config.ai.api_key.empty()) {
        for (auto& error : kata::validate_ai_config(config.ai))
            LOG(WARNING) << "AI configuration: " << error;
    } else {
        LOG(INFO) << "OPENAI_API_KEY is not set, AI judging requests will fail with an auth error";
    }

    try {
        kata::engine engine(config);

        if (vm.count("check-dependencies")) {
            auto deps = engine.check_dependencies(true);
            cout << nlohmann::json(*deps).dump(2) << endl;
            return deps->all_available ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        if (vm.count("execute")) {
            for (const char* required : {"language", "source", "kata"}) {
                if (!vm.count(required)) {
                    cerr << "--execute requires --" << required << endl;
                    return EXIT_FAILURE;
                }
            }

            kata::execution_request request;
            request.language = kata::parse_language(vm.at("language").as<string>());
            request.source_code = kata::read_file_content(vm.at("source").as<string>());
            request.kata_path = vm.at("kata").as<string>();
            request.include_hidden = vm.count("hidden") > 0;
            if (vm.count("timeout-ms"))
                request.timeout_ms = vm.at("timeout-ms").as<int>();

            kata::execution_result result = engine.execute(request);
            cout << nlohmann::json(result).dump(2) << endl;
            return result.success ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        if (vm.count("serve")) {
            kata::line_server server(engine, cin, cout);
            server.serve();
            return EXIT_SUCCESS;
        }
    } catch (std::invalid_argument& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    } catch (std::exception& e) {
        LOG(ERROR) << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    cerr << "Nothing to do, specify one of --serve, --execute or --check-dependencies" << endl
         << endl;
    cerr << desc << endl;
    return EXIT_FAILURE;
}
