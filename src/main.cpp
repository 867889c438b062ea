#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <thread>
#include "batch.hpp"
#include "common/cancellation.hpp"
#include "common/exceptions.hpp"
#include "common/time_source.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "remote/credentials.hpp"
#include "remote/curl_transport.hpp"
#include "remote/orchestrator.hpp"
#include "remote/throttler.hpp"
#include "store/problem_store.hpp"
using namespace std;
using namespace submitter;

static submitter::cancellation_token cancellation;

/**
 * @brief 在单独的线程中等待 SIGINT/SIGTERM，收到后取消批量提交
 * 信号处理函数中不能安全地加锁，因此先屏蔽信号，再由该线程 sigwait
 */
static void watch_signals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    thread([signals]() {
        int signum = 0;
        if (sigwait(&signals, &signum) == 0) {
            LOG(ERROR) << "Received signal " << signum << ", cancelling submissions";
            cancellation.cancel();
        }
    }).detach();
}

static nlohmann::json load_config_file(const string &path) {
    CHECK(filesystem::is_regular_file(path))
        << "Configuration file " << path << " does not exist";
    ifstream fin(path);
    nlohmann::json config;
    fin >> config;
    return config;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("submitter options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("help", "print this help message")
        ("model", po::value<string>()->required(), "submit the solutions generated by this model")
        ("problems", po::value<vector<string>>()->multitoken(), "problem files, or directories containing problem files with extension .json")
        ("config", po::value<string>(), "load endpoint, throttle and retry settings from the given JSON file")
        ("base-url", po::value<string>(), "set the judge service base url, default to https://leetcode.com. You can either pass it from environ JUDGEBASEURL")
        ("submit-retries", po::value<int>(), "set max attempts of submitting a solution, default to 5. You can either pass it from environ SUBMITRETRIES")
        ("check-retries", po::value<int>(), "set max attempts of checking a submission, default to 10. You can either pass it from environ CHECKRETRIES")
        ("min-delay", po::value<long long>(), "set minimum delay in milliseconds between two requests, default to 2000")
        ("max-delay", po::value<long long>(), "set maximum delay in milliseconds between two requests after slowing down, default to 60000")
        ("cookie-jar", po::value<string>(), "read LEETCODE_SESSION and csrftoken from a Netscape cookie file exported from the browser. You can either pass it from environ LEETCODE_COOKIE_JAR")
        ("force", "submit again even if a finished submission exists")
        ("dry-run", "submit but do not write results back to problem files")
        ("debug", "dump request and response bodies");
    // clang-format on
    positional.add("problems", -1);

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        if (vm.count("help")) {
            cout << desc << endl;
            return 0;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << desc << endl;
        return 1;
    }

    // 以 VLOG(1) 输出完整的请求和响应内容
    if (vm.count("debug"))
        FLAGS_v = max(FLAGS_v, 1);

    remote::judge_endpoint endpoint;
    remote::throttle_policy throttle_policy;
    remote::retry_policy retry_policy;
    try {
        if (vm.count("config")) {
            auto config = load_config_file(vm["config"].as<string>());
            if (config.count("endpoint")) config.at("endpoint").get_to(endpoint);
            if (config.count("throttle")) config.at("throttle").get_to(throttle_policy);
            if (config.count("retry")) config.at("retry").get_to(retry_policy);
        }

        if (vm.count("base-url")) {
            endpoint.base_url = vm["base-url"].as<string>();
        } else if (getenv("JUDGEBASEURL")) {
            endpoint.base_url = getenv("JUDGEBASEURL");
        }

        if (vm.count("submit-retries")) {
            retry_policy.submit_retries = vm["submit-retries"].as<int>();
        } else if (getenv("SUBMITRETRIES")) {
            retry_policy.submit_retries = boost::lexical_cast<int>(getenv("SUBMITRETRIES"));
        }

        if (vm.count("check-retries")) {
            retry_policy.check_retries = vm["check-retries"].as<int>();
        } else if (getenv("CHECKRETRIES")) {
            retry_policy.check_retries = boost::lexical_cast<int>(getenv("CHECKRETRIES"));
        }

        if (vm.count("min-delay"))
            throttle_policy.min_delay = chrono::milliseconds(vm["min-delay"].as<long long>());
        if (vm.count("max-delay"))
            throttle_policy.max_delay = chrono::milliseconds(vm["max-delay"].as<long long>());
    } catch (std::exception &e) {
        LOG(FATAL) << "Invalid configuration: " << e.what();
    }

    CHECK(retry_policy.submit_retries > 0 && retry_policy.check_retries > 0)
        << "submit-retries and check-retries should be positive";
    CHECK(throttle_policy.min_delay.count() >= 0 && throttle_policy.min_delay <= throttle_policy.max_delay)
        << "min-delay should be within [0, max-delay]";

    vector<filesystem::path> paths;
    if (vm.count("problems"))
        for (auto &problem : vm["problems"].as<vector<string>>())
            paths.push_back(problem);
    CHECK(!paths.empty()) << "No problem files given";

    string cookie_jar = vm.count("cookie-jar") ? vm["cookie-jar"].as<string>() : get_env("LEETCODE_COOKIE_JAR", "");

    watch_signals();
    curl_global_init(CURL_GLOBAL_DEFAULT);

    int exitcode = 0;
    try {
        auto chain = remote::default_credential_chain(cookie_jar, remote::host_of(endpoint.base_url));
        remote::credentials creds = chain.acquire();

        remote::curl_transport transport(endpoint, creds);
        real_time_source clock;
        remote::throttler throttle(throttle_policy, clock, cancellation);
        remote::submission_orchestrator orchestrator(transport, throttle, clock, cancellation, endpoint, retry_policy);
        store::json_problem_store problems(paths);

        batch_options options;
        options.model = vm["model"].as<string>();
        options.force = vm.count("force") > 0;
        options.dry_run = vm.count("dry-run") > 0;

        batch_summary summary = submit_batch(problems, orchestrator, options);
        if (summary.aborted)
            exitcode = 2;
        else if (summary.errors > 0)
            exitcode = 1;
    } catch (fatal_error &e) {
        LOG(ERROR) << "Aborting: " << e.what();
        exitcode = 2;
    } catch (std::exception &e) {
        LOG(ERROR) << boost::diagnostic_information(e);
        exitcode = 2;
    }

    curl_global_cleanup();
    return exitcode;
}
