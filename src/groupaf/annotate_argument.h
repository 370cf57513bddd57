#ifndef GRPAF_ANNOTATE_ARGUMENT_H_
#define GRPAF_ANNOTATE_ARGUMENT_H_
#include <cstdint>
#include <string>

namespace grpaf
{

/*!
 * @brief immutable configuration of one annotate run, collected from the command line
 * input, labels and strict mode are consumed by GrpafTool::start_up before the run begins
 */
typedef struct AnnotateArgument
{
    std::string output;
    std::string tags;
    int32_t compression_level;
    std::string tool_name;
    std::string command_line;
    std::string version;
} AnnotateArgument, *pAnnotateArgument;

}  // namespace grpaf

#endif  // GRPAF_ANNOTATE_ARGUMENT_H_
