#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/grading_orchestrator.hpp"
#include "judge/repository.hpp"
#include "server/spool_server.hpp"
#include "worker.hpp"
using namespace std;
namespace fs = std::filesystem;

static atomic<bool> stop_requested{false};

void stopHandler(int /* signum */) {
    stop_requested = true;
}

static void print_json(const nlohmann::json &j) {
    cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
}

/**
 * @brief 读取评测请求 {"submission": {...}, "problem": {...}}
 */
static pair<labjudge::submission, labjudge::problem> read_request(const fs::path &path) {
    nlohmann::json j = nlohmann::json::parse(labjudge::read_file_content(path));
    auto submit = nlohmann::access(j, "submission").get<labjudge::submission>();
    auto prob = nlohmann::access(j, "problem").get<labjudge::problem>();
    return {submit, prob};
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    fs::path current(argv[0]);
    fs::path bin_dir(fs::weakly_canonical(current).parent_path());

    // 默认情况下，假设 runguard 与 labjudge 编译在同一个目录中
    if (!getenv("RUNGUARD")) {
        fs::path runguard(bin_dir / "runguard");
        if (fs::exists(runguard)) {
            labjudge::set_env("RUNGUARD", runguard.string());
        }
    }

    namespace po = boost::program_options;
    po::options_description desc("labjudge options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("mode", po::value<string>(), "grade, samples, execute or serve")
        ("config,c", po::value<string>(), "load configuration from JSON file. You can either pass it from environ LABJUDGE_CONFIG")
        ("request,r", po::value<string>(), "grade/samples: request file containing submission and problem")
        ("output", po::value<string>(), "grade: directory to persist the submission to, as <id>.json")
        ("language,l", po::value<string>(), "execute: language of the source file")
        ("source,s", po::value<string>(), "execute: source file to run")
        ("stdin,i", po::value<string>(), "execute: file to be used as standard input")
        ("time-limit,t", po::value<double>()->default_value(5), "execute: time limit in seconds")
        ("memory-limit,m", po::value<int>()->default_value(256), "execute: memory limit in MB")
        ("spool", po::value<string>(), "serve: spool directory with inbox, processing, outbox and rejected. You can either pass it from environ SPOOLDIR")
        ("backend", po::value<string>(), "sandbox backend, runguard or container")
        ("run-dir", po::value<string>(), "set the directory to run user programs, store compiled user program. You can either pass it from environ RUNDIR")
        ("runguard", po::value<string>(), "set the runguard executable. You can either pass it from environ RUNGUARD")
        ("chroot-dir", po::value<string>(), "set the chroot directory. You can either pass it from environ CHROOTDIR")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("workers", po::value<size_t>(), "serve: number of submissions graded in parallel")
        ("max-sandboxes", po::value<size_t>(), "maximum number of sandboxes running simultaneously")
        ("debug", "turn on the debug mode to keep box and run directories to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("mode", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help") || !vm.count("mode")) {
        cout << "labjudge: compile and run untrusted code in sandboxes, grade it against test cases" << endl
             << "The runguard backend requires root privilege (or a setuid runguard)" << endl
             << "Usage: " << argv[0] << " grade --request <file>" << endl
             << "       " << argv[0] << " samples --request <file>" << endl
             << "       " << argv[0] << " execute --language <language> --source <file> [--stdin <file>]" << endl
             << "       " << argv[0] << " serve --spool <dir>" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("version")) {
        cout << "labjudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    labjudge::labjudge_config config;
    string config_file;
    if (vm.count("config")) {
        config_file = vm["config"].as<string>();
    } else if (getenv("LABJUDGE_CONFIG")) {
        config_file = getenv("LABJUDGE_CONFIG");
    }
    if (!config_file.empty()) {
        CHECK(fs::is_regular_file(config_file))
            << "Configuration file " << config_file << " does not exist";
        try {
            config = labjudge::load_config(config_file);
        } catch (std::exception& e) {
            LOG(FATAL) << e.what();
        }
    }

    if (vm.count("debug") || getenv("DEBUG")) config.debug = true;

    if (vm.count("backend")) config.backend = vm["backend"].as<string>();

    if (vm.count("run-dir")) {
        config.run_dir = vm["run-dir"].as<string>();
    } else if (getenv("RUNDIR")) {
        config.run_dir = getenv("RUNDIR");
    }
    fs::create_directories(config.run_dir);
    CHECK(fs::is_directory(config.run_dir))
        << "Run directory " << config.run_dir << " does not exist";

    if (vm.count("runguard")) {
        config.runguard = vm["runguard"].as<string>();
    } else if (getenv("RUNGUARD")) {
        config.runguard = getenv("RUNGUARD");
    }

    if (vm.count("chroot-dir")) {
        config.chroot_dir = vm["chroot-dir"].as<string>();
    } else if (getenv("CHROOTDIR")) {
        config.chroot_dir = getenv("CHROOTDIR");
    }
    if (!config.chroot_dir.empty())
        CHECK(fs::is_directory(config.chroot_dir))
            << "Chroot directory " << config.chroot_dir << " does not exist";

    if (vm.count("run-user")) {
        config.run_user = vm["run-user"].as<string>();
    } else if (getenv("RUNUSER")) {
        config.run_user = getenv("RUNUSER");
    }

    if (vm.count("run-group")) {
        config.run_group = vm["run-group"].as<string>();
    } else if (getenv("RUNGROUP")) {
        config.run_group = getenv("RUNGROUP");
    }

    if (vm.count("workers")) config.workers = vm["workers"].as<size_t>();
    if (vm.count("max-sandboxes")) config.max_sandboxes = vm["max-sandboxes"].as<size_t>();

    try {
        config.validate();
    } catch (std::invalid_argument& e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    labjudge::toolchain_registry toolchains;
    try {
        toolchains = config.make_toolchains();
    } catch (std::exception& e) {
        LOG(FATAL) << "Unable to load toolchains: " << e.what();
    }

    auto backend = config.make_sandbox();
    try {
        backend->health_check();
    } catch (std::exception& e) {
        LOG(ERROR) << "Sandbox backend " << backend->name() << " is unavailable: " << e.what();
        return EXIT_FAILURE;
    }
    LOG(INFO) << "Using sandbox backend " << backend->name();

    labjudge::sandbox_manager manager(*backend, toolchains, config.make_sandbox_manager_config());

    string mode = vm["mode"].as<string>();
    int ret = EXIT_SUCCESS;
    try {
        if (mode == "grade") {
            CHECK(vm.count("request")) << "grade requires --request";
            auto [submit, prob] = read_request(vm["request"].as<string>());
            labjudge::check_request(submit, prob);

            unique_ptr<labjudge::submission_repository> repository;
            if (vm.count("output"))
                repository = make_unique<labjudge::json_file_repository>(vm["output"].as<string>());
            else
                repository = make_unique<labjudge::memory_repository>();

            labjudge::grading_orchestrator orchestrator(manager, *repository, config.make_grading_config());
            orchestrator.grade(submit, prob);
            print_json(submit.snapshot());
        } else if (mode == "samples") {
            CHECK(vm.count("request")) << "samples requires --request";
            auto [submit, prob] = read_request(vm["request"].as<string>());

            labjudge::memory_repository repository;
            labjudge::grading_orchestrator orchestrator(manager, repository, config.make_grading_config());
            print_json(orchestrator.run_samples(submit.code, submit.language, prob));
        } else if (mode == "execute") {
            CHECK(vm.count("language")) << "execute requires --language";
            CHECK(vm.count("source")) << "execute requires --source";
            string code = labjudge::read_file_content(vm["source"].as<string>());
            string stdin_data = vm.count("stdin") ? labjudge::read_file_content(vm["stdin"].as<string>()) : "";

            labjudge::memory_repository repository;
            labjudge::grading_orchestrator orchestrator(manager, repository, config.make_grading_config());
            print_json(orchestrator.execute(code, vm["language"].as<string>(), stdin_data,
                                            vm["time-limit"].as<double>(), vm["memory-limit"].as<int>()));
        } else if (mode == "serve") {
            fs::path spool_dir;
            if (vm.count("spool")) {
                spool_dir = vm["spool"].as<string>();
            } else if (getenv("SPOOLDIR")) {
                spool_dir = getenv("SPOOLDIR");
            }
            CHECK(!spool_dir.empty()) << "serve requires --spool";

            signal(SIGINT, stopHandler);
            signal(SIGTERM, stopHandler);

            labjudge::json_file_repository repository(labjudge::server::spool_server::outbox_dir(spool_dir));
            labjudge::grading_orchestrator orchestrator(manager, repository, config.make_grading_config());
            labjudge::grading_service service(orchestrator, repository, config.workers);
            labjudge::server::spool_server server(spool_dir, service);
            server.serve(stop_requested);
            service.stop();
        } else {
            cerr << "Unknown mode " << mode << endl
                 << desc << endl;
            ret = EXIT_FAILURE;
        }
    } catch (labjudge::invalid_submission& e) {
        cerr << "Invalid request: " << e.what() << endl;
        ret = EXIT_FAILURE;
    } catch (labjudge::unsupported_language& e) {
        cerr << e.what() << endl;
        ret = EXIT_FAILURE;
    } catch (std::exception& e) {
        LOG(ERROR) << boost::diagnostic_information(e);
        ret = EXIT_FAILURE;
    }

    backend->shutdown();
    return ret;
}
