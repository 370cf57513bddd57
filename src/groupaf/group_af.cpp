#include "group_af.h"

#include <cstdio>
#include <utility>

#include "genotype_normalizer.h"
#include "grpaf_exception.h"
#include "grpaf_logger.h"
#include "record_annotator.h"

static bool ANNOTATE = GrpafToolRegister::instance().register_tool("annotate", [] { return std::make_unique<GroupAlleleFrequency>(); });

static constexpr uint64_t k_progress_interval = 10000;

GroupAlleleFrequency::GroupAlleleFrequency()
    : annotate_args_(nullptr)
    , writer_(nullptr)
    , tags_({})
    , descriptors_({})
{}

void GroupAlleleFrequency::clear_and_exit()
{
    GrpafLogger::error("exiting");
    k_outfile = nullptr;
    if (writer_) {
        try {
            writer_->close_file();
        }
        catch (const grpaf::OutputError& e) {
            GrpafLogger::error("{}", e.what());
        }
    }
}

void GroupAlleleFrequency::do_work()
{
    init_args();

    tags_ = grpaf::parse_info_tags(annotate_args_->tags);
    grpaf::InfoHeaderBuilder builder;
    builder.add_groups(masks_, tags_);
    descriptors_ = builder.finalize();
    GrpafLogger::debug("{} INFO descriptors for {} groups", descriptors_.size(), masks_.size());

    writer_ = std::make_unique<VcfWriter>(annotate_args_->compression_level);
    writer_->start(annotate_args_->output, vcf_loader_->header(), descriptors_, annotate_args_->tool_name, annotate_args_->command_line);
    k_outfile = writer_->vcf_file_ptr();

    grpaf::RecordAnnotator annotator{masks_, descriptors_, grpaf::needs_hwe(tags_)};
    grpaf::GenotypeVector genotypes;
    bcf1_t* b = nullptr;
    while (nullptr != (b = vcf_loader_->next())) {
        std::string locus = vcf_loader_->locus();
        vcf_loader_->genotypes(genotypes);
        grpaf::AnnotatedValues values = annotator.annotate(genotypes, b->n_allele - 1, locus);
        writer_->write(b, values);

        if (vcf_loader_->records_read() % k_progress_interval == 0) {
            GrpafLogger::info("processed {} variants, last {}", vcf_loader_->records_read(), locus);
        }
    }

    k_outfile = nullptr;
    writer_->close_file();
    GrpafLogger::info("annotated {} variants", writer_->records_written());
}

void GroupAlleleFrequency::init_args()
{
    auto args = std::make_unique<grpaf::AnnotateArgument>();
    args->output = grpaf_args_->output_path();
    args->tags = grpaf_args_->tags();
    args->compression_level = grpaf_args_->compression_level();
    args->tool_name = grpaf_args_->tool();
    args->command_line = grpaf_args_->command_line();
    args->version = grpaf_args_->version();

    // stdout may carry the vcf
    fprintf(stderr,
            "%s startup parameters:\n"
            "    version                        = %s\n"
            "    input                          = %s\n"
            "    output                         = %s\n"
            "    labels                         = %s\n"
            "    tags                           = %s\n"
            "    strict                         = %s\n"
            "    compression level              = %d\n"
            "    command line                   = %s\n\n",
            args->tool_name.c_str(), args->version.c_str(), input_path_.c_str(), args->output.c_str(), labels_path_.c_str(),
            args->tags.c_str(), grpaf_args_->strict() ? "true" : "false", args->compression_level, args->command_line.c_str());

    annotate_args_ = std::move(args);
}
