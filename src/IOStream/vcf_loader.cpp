#include "vcf_loader.h"

#include <cstdlib>

#include "fmt/format.h"
#include "grpaf_exception.h"
#include "grpaf_logger.h"

using grpaf::InputError;

void VcfLoader::initialization(const std::string& path)
{
    path_ = path;
    fd_ = bcf_open(path.c_str(), "r");
    CHECK_CONDITION_THROW(nullptr == fd_, InputError, "open vcf file error: {}", path);

    hdr_ = bcf_hdr_read(fd_);
    CHECK_CONDITION_THROW(nullptr == hdr_, InputError, "read vcf header error: {}", path);

    record_ = bcf_init();
    CHECK_CONDITION_THROW(nullptr == record_, InputError, "alloc bcf1_t error");

    int32_t n_samples = bcf_hdr_nsamples(hdr_);
    samples_.reserve(static_cast<size_t>(n_samples));
    for (int32_t i{0}; i < n_samples; ++i) {
        samples_.emplace_back(hdr_->samples[i]);
    }
    GrpafLogger::debug("opened {} with {} samples", path, n_samples);
}

void VcfLoader::terminalization()
{
    if (nullptr != gt_arr_) {
        free(gt_arr_);
        gt_arr_ = nullptr;
        n_gt_arr_ = 0;
    }
    if (nullptr != record_) {
        bcf_destroy(record_);
        record_ = nullptr;
    }
    if (nullptr != hdr_) {
        bcf_hdr_destroy(hdr_);
        hdr_ = nullptr;
    }
    if (nullptr != fd_) {
        if (0 != hts_close(fd_)) {
            GrpafLogger::warn("close vcf file error: {}", path_);
        }
        fd_ = nullptr;
    }
}

bcf1_t* VcfLoader::next()
{
    int32_t ret = bcf_read(fd_, hdr_, record_);
    if (-1 == ret && 0 == record_->errcode) {
        return nullptr;
    }
    CHECK_CONDITION_THROW(ret < -1 || record_->errcode != 0, InputError, "parse error in record {} of {} (errcode {})",
                          records_read_ + 1, path_, record_->errcode);
    CHECK_CONDITION_THROW(0 != bcf_unpack(record_, BCF_UN_ALL), InputError, "unpack error in record {} of {}", records_read_ + 1,
                          path_);
    records_read_++;
    return record_;
}

void VcfLoader::genotypes(grpaf::GenotypeVector& out)
{
    int32_t n_samples = bcf_hdr_nsamples(hdr_);
    int32_t n_gt = bcf_get_genotypes(hdr_, record_, &gt_arr_, &n_gt_arr_);
    if (n_gt <= 0) {
        grpaf::GenotypeNormalizer::normalize_all(nullptr, 0, n_samples, out);
        return;
    }
    try {
        grpaf::GenotypeNormalizer::normalize_all(gt_arr_, n_gt, n_samples, out);
    }
    catch (const grpaf::FormatError& e) {
        throw grpaf::FormatError(fmt::format("reading GT of {}: {}", locus(), e.what()));
    }
}

std::string VcfLoader::locus() const { return fmt::format("{}:{}", bcf_seqname(hdr_, record_), record_->pos + 1); }
