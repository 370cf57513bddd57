#ifndef GRPAF_PLUGIN_H
#define GRPAF_PLUGIN_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "group_mask.h"
#include "grpaf_logger.h"
#include "grpaf_tool_args.h"
#include "label_loader.h"
#include "vcf_loader.h"

/// @brief output file closed by the signal handler, set while records are being written
inline htsFile *k_outfile = nullptr;

class GrpafTool
{
public:
    GrpafTool();
    virtual ~GrpafTool();
    virtual void do_work() = 0;
    virtual void clear_and_exit() = 0;
    bool initialize_args(int argc, char *argv[]);
    void run();

private:
    void start_up();
    void initialize_input();
    void initialize_labels();
    void initialize_masks();

public:
    std::unique_ptr<GrpafToolArgs> grpaf_args_;
    std::unique_ptr<VcfLoader> vcf_loader_;
    std::unique_ptr<LabelLoader> label_loader_;
    grpaf::GroupMasks masks_;
    std::string input_path_;
    std::string labels_path_;
};

inline GrpafTool::GrpafTool()
    : grpaf_args_(nullptr)
    , vcf_loader_(nullptr)
    , label_loader_(nullptr)
    , masks_({})
    , input_path_("")
    , labels_path_("")
{}

inline GrpafTool::~GrpafTool()
{
    vcf_loader_.reset();
    label_loader_.reset();
    if (grpaf_args_) {
        GrpafLogger::info("grpaf-{} finished", grpaf_args_->tool());
    }
}

inline bool GrpafTool::initialize_args(int argc, char *argv[])
{
    grpaf_args_ = std::make_unique<GrpafToolArgs>(argc, argv);
    return grpaf_args_->valid_check();
}

inline void GrpafTool::start_up()
{
    initialize_input();
    initialize_labels();
    initialize_masks();
}

inline void GrpafTool::run()
{
    start_up();
    do_work();
}

inline void GrpafTool::initialize_input()
{
    input_path_ = grpaf_args_->input_path();
    vcf_loader_ = std::make_unique<VcfLoader>();
    vcf_loader_->initialization(input_path_);
}

inline void GrpafTool::initialize_labels()
{
    labels_path_ = grpaf_args_->labels_path();
    label_loader_ = std::make_unique<LabelLoader>(labels_path_);
    const grpaf::GroupMembership &membership = label_loader_->get_membership();
    GrpafLogger::info("Loaded {} groups from {} label rows", membership.groups.size(), label_loader_->get_rows());
    if (membership.empty()) {
        GrpafLogger::warn("label file {} declares no group, records are written without annotation", labels_path_);
    }
}

// strict mode rejects label samples missing from the input before any record is read
inline void GrpafTool::initialize_masks()
{
    const grpaf::SampleOrder &samples = vcf_loader_->samples();
    const grpaf::GroupMembership &membership = label_loader_->get_membership();

    for (const std::string &sample : grpaf::GroupMaskBuilder::check_consistency(samples, membership, grpaf_args_->strict())) {
        GrpafLogger::warn("label sample {} is absent from {}, ignored", sample, input_path_);
    }

    masks_ = grpaf::GroupMaskBuilder::build(samples, membership);
    for (const grpaf::GroupMask &mask : masks_) {
        GrpafLogger::debug("group {}: {} of {} declared samples present", mask.group, mask.size, mask.declared);
    }
}

class GrpafToolRegister
{
public:
    using Creator = std::function<std::unique_ptr<GrpafTool>()>;
    static GrpafToolRegister &instance()
    {
        static GrpafToolRegister instance;
        return instance;
    }

    bool register_tool(const std::string &tool_name, Creator creator)
    {
        creators[tool_name] = std::move(creator);
        return !creators.empty();
    }

    std::unique_ptr<GrpafTool> creat_tool(const std::string &tool_name)
    {
        const auto &it = creators.find(tool_name);
        if (it != creators.end()) {
            GrpafLogger::info("grpaf-{} launched", tool_name);
            return it->second();
        }
        return nullptr;
    }

    void supported_tools()
    {
        std::string all_tools;
        for (const auto &it : creators) {
            all_tools.append(all_tools.empty() ? "" : ",").append(it.first);
        }
        GrpafLogger::info("supported tools: {}", all_tools);
    }

private:
    GrpafToolRegister() = default;
    std::map<std::string, Creator> creators;
};

#endif  // GRPAF_PLUGIN_H
