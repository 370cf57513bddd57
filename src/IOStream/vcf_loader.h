#ifndef VCF_LOADER_H
#define VCF_LOADER_H
#include <string>
#include <vector>

#include "genotype_normalizer.h"
#include "group_mask.h"
#include "htslib/vcf.h"

/// @brief Sequential VCF/BCF reader, one record is alive at a time
class VcfLoader
{
private:
    htsFile* fd_;
    bcf_hdr_t* hdr_;
    bcf1_t* record_;
    int32_t* gt_arr_;
    int32_t n_gt_arr_;
    uint64_t records_read_;
    std::string path_;
    grpaf::SampleOrder samples_;

public:
    VcfLoader()
        : fd_(nullptr)
        , hdr_(nullptr)
        , record_(nullptr)
        , gt_arr_(nullptr)
        , n_gt_arr_(0)
        , records_read_(0)
        , path_()
        , samples_()
    {}

    ~VcfLoader() { terminalization(); }

    VcfLoader(const VcfLoader&) = delete;
    VcfLoader& operator=(const VcfLoader&) = delete;

    /// @brief Resource initialization
    /// @param path vcf, vcf.gz or bcf file, "-" reads standard input
    /// @throw InputError when the file or its header cannot be read
    void initialization(const std::string& path);

    /// @brief Resource release, safe to call more than once
    void terminalization();

    /// @brief Read the next record, INFO and FORMAT unpacked
    /// @return the loader-owned record, nullptr at end of stream; invalidated by the next call
    /// @throw InputError naming the record ordinal on a parse error
    bcf1_t* next();

    /// @brief Normalize the GT field of the current record, all samples missing when the record has no GT
    void genotypes(grpaf::GenotypeVector& out);

    /// @return "<chrom>:<pos>" of the current record, 1-based
    std::string locus() const;

    bcf_hdr_t* header() const { return hdr_; }
    const grpaf::SampleOrder& samples() const { return samples_; }
    uint64_t records_read() const { return records_read_; }
};

#endif  // VCF_LOADER_H
