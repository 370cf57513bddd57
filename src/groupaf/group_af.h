#ifndef GRPAF_GROUP_AF_H
#define GRPAF_GROUP_AF_H

#include <memory>

#include "annotate_argument.h"
#include "grpaf_tool.hpp"
#include "info_header_builder.h"
#include "info_tag.h"
#include "vcf_writer.h"

class GroupAlleleFrequency : public GrpafTool
{
private:
    std::unique_ptr<const grpaf::AnnotateArgument> annotate_args_;
    std::unique_ptr<VcfWriter> writer_;
    grpaf::InfoTagVector tags_;
    grpaf::InfoDescriptors descriptors_;

public:
    GroupAlleleFrequency();
    ~GroupAlleleFrequency() override = default;
    void do_work() override;
    void clear_and_exit() override;

private:
    void init_args();
};

#endif  // GRPAF_GROUP_AF_H
