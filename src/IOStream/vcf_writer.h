#ifndef VCF_WRITER_H
#define VCF_WRITER_H
#include <string>
#include <vector>

#include "htslib/vcf.h"
#include "info_header_builder.h"
#include "record_annotator.h"

/// @brief Annotated VCF output: input header minus stale tags plus the synthesized descriptors
class VcfWriter
{
private:
    htsFile* out_file_;
    bcf_hdr_t* in_hdr_;
    bcf_hdr_t* out_hdr_;
    int32_t compression_level_;
    std::string path_;
    std::vector<std::string> stale_tags_;
    uint64_t records_written_;

public:
    explicit VcfWriter(int32_t compression_level)
        : out_file_(nullptr)
        , in_hdr_(nullptr)
        , out_hdr_(nullptr)
        , compression_level_(compression_level)
        , path_()
        , stale_tags_()
        , records_written_(0)
    {}

    ~VcfWriter();

    VcfWriter(const VcfWriter&) = delete;
    VcfWriter& operator=(const VcfWriter&) = delete;

    /// @brief Open the output and write the header
    /// @param path output file, "-" writes standard output, a ".gz" suffix selects bgzip
    /// @param in_hdr header of the input, borrowed until close_file
    /// @throw OutputError on any htslib failure
    void start(const std::string& path, bcf_hdr_t* in_hdr, const grpaf::InfoDescriptors& descriptors, const std::string& tool_name,
               const std::string& command_line);

    /// @brief Drop stale tags, translate to the output header, set the new values and write
    /// @throw OutputError
    void write(bcf1_t* b, const grpaf::AnnotatedValues& values);

    /// @brief Flush and close, safe to call more than once
    /// @throw OutputError when the final flush fails
    void close_file();

    htsFile* vcf_file_ptr() { return out_file_; }
    bcf_hdr_t* bcf_header() const { return out_hdr_; }
    const std::vector<std::string>& stale_tags() const { return stale_tags_; }
    uint64_t records_written() const { return records_written_; }

    /// @brief Create the output header; static so tests can build it without an output file
    /// @param stale_tags out| INFO ids of in_hdr left by a previous annotate run, removed from the result
    static bcf_hdr_t* init_vcf_header(bcf_hdr_t* in_hdr, const grpaf::InfoDescriptors& descriptors, const std::string& tool_name,
                                      const std::string& command_line, std::vector<std::string>& stale_tags);

    static bool is_gz_file(const char* filename);
    static std::string generate_command_line(const std::string& tool_name, const std::string& command_line);

    /// @brief Double quotes would end the header value early, they become single quotes
    static std::string quote_command_line(const std::string& command_line);
};

#endif  // VCF_WRITER_H
