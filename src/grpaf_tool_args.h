#ifndef GRPAF_TOOL_ARGS_H
#define GRPAF_TOOL_ARGS_H

#include <fcntl.h>
#include <unistd.h>

#include <boost/program_options.hpp>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "grpaf_logger.h"
#include "version.h"

namespace po = boost::program_options;
class GrpafToolArgs
{
public:
    struct argument_range
    {
        int32_t min;
        int32_t max;
    };

public:
    GrpafToolArgs(int argc, char* argv[]);
    bool valid_check();
    static void valid_range(const std::string& name, int value, const argument_range& range);
    static void usage();
    static bool input_accessible(const std::string& path);
    static bool output_writeable(const std::string& path);
    const std::string& tool() const { return tool_name_; }
    const std::string& version() const { return main_version_; }
    const std::string& input_path() const { return input_file_; }
    const std::string& output_path() const { return out_file_; }
    const std::string& labels_path() const { return labels_file_; }
    const std::string& tags() const { return tags_; }
    bool strict() const { return strict_; }
    bool verbose() const { return verbose_; }
    int32_t compression_level() const { return compression_level_; }
    const std::string& command_line() const { return command_line_; }

private:
    po::variables_map vm_;
    std::string tool_name_;
    std::string input_file_;
    std::string out_file_;
    std::string labels_file_;
    std::string tags_;
    std::string command_line_;
    std::string main_version_;
    bool strict_{false};
    bool verbose_{false};
    bool parsed_{false};
    int32_t compression_level_{DEFAULT_COMPRESSION_LEVEL};

    static constexpr const int32_t DEFAULT_COMPRESSION_LEVEL = 6;
    static constexpr const argument_range COMPRESSION_LEVEL_RANGE = {0, 9};

    static constexpr const char* INPUT_PATH_NAME = "input,I";
    static constexpr const char* INPUT_PATH_LONGNAME = "input";
    static constexpr const char* OUTUT_PATH_NAME = "output,O";
    static constexpr const char* LABELS_PATH_NAME = "labels,l";
    static constexpr const char* TAGS_NAME = "tags,t";
    static constexpr const char* STRICT_NAME = "strict";
    static constexpr const char* VERBOSE_NAME = "verbose,v";
    static constexpr const char* HELP_NAME = "help,H";
    static constexpr const char* HELP_LONGNAME = "help";
    static constexpr const char* VERSION_NAME = "version,V";
    static constexpr const char* VERSION_LONGNAME = "version";
    static constexpr const char* COMPRESSION_LEVEL = "compression-level";
};

// clang-format off
inline GrpafToolArgs::GrpafToolArgs(int argc, char* argv[])
{
    tool_name_ = argv[1];
    main_version_ = MAIN_VERSION;
    po::options_description annotate("annotate options");
    po::positional_options_description positional;
    positional.add(INPUT_PATH_LONGNAME, 1);

    annotate.add_options()(HELP_NAME, "produce help message")(
        VERSION_NAME, "display version information")(
        INPUT_PATH_NAME, po::value<std::string>(&input_file_)->default_value("-"), "input file")(
        OUTUT_PATH_NAME, po::value<std::string>(&out_file_)->default_value("-"), "output file")(
        LABELS_PATH_NAME, po::value<std::string>(&labels_file_)->required(), "sample to group label file")(
        TAGS_NAME, po::value<std::string>(&tags_)->default_value("all"), "tags to annotate")(
        STRICT_NAME, po::bool_switch(&strict_)->default_value(false), "fail on label samples absent from the input")(
        VERBOSE_NAME, po::bool_switch(&verbose_)->default_value(false), "debug logging")(
        COMPRESSION_LEVEL, po::value<int32_t>(&compression_level_)->default_value(DEFAULT_COMPRESSION_LEVEL)->notifier([](int32_t value){valid_range(COMPRESSION_LEVEL, value, COMPRESSION_LEVEL_RANGE);}), "compression level");
    // clang-format on
    try {
        po::store(po::command_line_parser(argc - 1, argv + 1).options(annotate).positional(positional).run(), vm_);

        if (vm_.count(VERSION_LONGNAME)) {
            fprintf(stdout,
                    "version                        = %s\n"
                    "dev version                    = %s\n"
                    "dev branch                     = %s\n"
                    "dev id                         = %s\n\n",
                    MAIN_VERSION, GIT_DES, GIT_BRANCH, GIT_ID_LONG);
            exit(0);
        }

        if (vm_.count(HELP_LONGNAME)) {
            usage();
            exit(0);
        }

        po::notify(vm_);
        parsed_ = true;
    }
    catch (const po::error& e) {
        GrpafLogger::error("{}", e.what());
        usage();
    }

    std::string path{argv[0]};
    auto pos = path.find_last_of('/');
    command_line_ = pos == std::string::npos ? path : path.substr(pos + 1);
    for (int32_t i = 1; i < argc; ++i) {
        command_line_.append(1, ' ').append(argv[i]);
    }
}

// clang-format off
inline void GrpafToolArgs::usage()
{
    std::cerr << std::endl;
    std::cerr << "Usage: grpaf annotate [-option] [<input>]" << std::endl;
    std::cerr << "Required:" << std::endl;
    std::cerr << "  -l, --labels <file>                         two column <sample>\\t<group> label file" << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  -H, --help                                  display help message" << std::endl;
    std::cerr << "  -V, --version                               display version message" << std::endl;
    std::cerr << "  -I, --input <file>                          input vcf/bcf file, '-' for stdin (default: -)" << std::endl;
    std::cerr << "  -O, --output <file>                         output vcf file, '-' for stdout (default: -)" << std::endl;
    std::cerr << "                                              a .gz suffix writes bgzip compressed output" << std::endl;
    std::cerr << "  -t, --tags <list>                           comma separated tags or 'all' (default: all)" << std::endl;
    std::cerr << "                                              available: AF,MAF,MAC,AC,AN,N_HEMI,N_MISS,N_HOMREF,N_HET,N_HOMALT,ExcHet,HWE" << std::endl;
    std::cerr << "      --strict                                abort when a label sample is absent from the input (default: false)" << std::endl;
    std::cerr << "  -v, --verbose                               debug logging (default: false)" << std::endl;
    std::cerr << "      --compression-level                     compression level, must be in [0, 9] (default: 6)" << std::endl;
    std::cerr << std::endl;
}
// clang-format on

inline bool GrpafToolArgs::valid_check()
{
    if (!parsed_) {
        return false;
    }
    return input_accessible(input_file_) && input_accessible(labels_file_) && output_writeable(out_file_);
}

/// @brief "-" is standard input and is not checked
inline bool GrpafToolArgs::input_accessible(const std::string& path)
{
    if (path == "-") {
        return true;
    }
    if (access(path.c_str(), F_OK) != 0) {
        GrpafLogger::error("file: {} not exist", path);
        return false;
    }
    if (access(path.c_str(), R_OK) != 0) {
        GrpafLogger::error("file: {} not readable", path);
        return false;
    }
    return true;
}

inline bool GrpafToolArgs::output_writeable(const std::string& path)
{
    if (path == "-") {
        return true;
    }
    int fd = open(path.c_str(), O_WRONLY | O_CREAT, 0666);
    if (fd == -1) {
        GrpafLogger::error("file: {} not writeable", path);
        return false;
    }
    close(fd);
    return true;
}

inline void GrpafToolArgs::valid_range(const std::string& name, int value, const argument_range& range)
{
    if (value < range.min || value > range.max) {
        throw po::validation_error(po::validation_error::invalid_option_value, name, std::to_string(value));
    }
}

#endif  // GRPAF_TOOL_ARGS_H
