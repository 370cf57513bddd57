#ifndef GRPAF_SIGNAL_HANDLER_H
#define GRPAF_SIGNAL_HANDLER_H

#include <unistd.h>

#include <csignal>
#include <cstdlib>

#include "grpaf_logger.h"
#include "grpaf_tool.hpp"

class GrpafSignalHandler
{
private:
    GrpafSignalHandler() = default;

public:
    static void setup_signal_handler();
    static void signal_handler(int signal);
};

inline void GrpafSignalHandler::setup_signal_handler()
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

inline void GrpafSignalHandler::signal_handler(int signal)
{
    if (signal == SIGINT) {
        GrpafLogger::error("recieved signal: SIGINT. exiting");
        if (k_outfile != nullptr) hts_close(k_outfile);
        _exit(EXIT_FAILURE);
    }
    if (signal == SIGTERM) {
        GrpafLogger::error("recieved signal: SIGTERM. exiting");
        if (k_outfile != nullptr) hts_close(k_outfile);
        _exit(EXIT_FAILURE);
    }
}

#endif  // GRPAF_SIGNAL_HANDLER_H
