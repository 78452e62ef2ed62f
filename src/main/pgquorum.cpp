#include <csignal>
#include "pgquorum_cli_utils.h"
#include "http_client.h"

int main(int argc, char **argv) {
    Config config;

    cmdline::parser options;
    init_cmdline_options(options, argc, argv);
    options.parse_check(argc, argv);

    if(options.rest().size() != 1) {
        std::cerr << "Exactly one command is expected." << std::endl;
        std::cerr << options.usage() << std::endl;
        return EXIT_OPERATION_FAILED;
    }

    // Command line args override env vars
    config.load_config_env();
    config.load_config_file(options);
    config.load_config_cmd_args(options);

    Option<bool> config_validation = config.is_valid();

    if(!config_validation.ok()) {
        std::cerr << "Invalid configuration: " << config_validation.error() << std::endl;
        std::cerr << "Command line " << options.usage() << std::endl;
        std::cerr << "You can also pass these arguments as environment variables such as "
                  << "PGQUORUM_ROLE, PGQUORUM_NODES, etc." << std::endl;
        return EXIT_OPERATION_FAILED;
    }

    int ret_code = init_root_logger(config, "pgquorum");
    if(ret_code != 0) {
        return ret_code;
    }

    // a node closing its connection mid-request must not take the process down
    signal(SIGPIPE, SIG_IGN);

    HttpClient::get_instance().init();

    ret_code = run_command(config, options.rest()[0], options.get<std::string>("address"));

    HttpClient::get_instance().dispose();
    google::ShutdownGoogleLogging();

    return ret_code;
}
