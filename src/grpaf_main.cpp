#include "grpaf_main.h"

#include <cstdlib>

#include "grpaf_logger.h"
#include "grpaf_signal_handler.h"
#include "grpaf_tool.hpp"

int grpaf_main(int argc, char* argv[])
{
    GrpafLogger::init_stderr_logger();
    GrpafLogger::set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] [%s:%!:%#] %v.");

    auto& register_ = GrpafToolRegister::instance();
    if (argc < 2) {
        GrpafLogger::error("no grpaf tool specified");
        register_.supported_tools();
        return EXIT_FAILURE;
    }

    std::unique_ptr<GrpafTool> run_tool = register_.creat_tool(argv[1]);
    if (!run_tool) {
        GrpafLogger::error("invalid grpaf tool name: {}", argv[1]);
        register_.supported_tools();
        return EXIT_FAILURE;
    }

    if (!run_tool->initialize_args(argc, argv)) {
        GrpafLogger::error("invalid grpaf tool args");
        return EXIT_FAILURE;
    }
    if (run_tool->grpaf_args_->verbose()) {
        GrpafLogger::set_level(spdlog::level::debug);
    }

    try {
        GrpafSignalHandler::setup_signal_handler();
        run_tool->run();
    }
    catch (const std::runtime_error& e) {
        GrpafLogger::error("{}", e.what());
        run_tool->clear_and_exit();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) { return grpaf_main(argc, argv); }
