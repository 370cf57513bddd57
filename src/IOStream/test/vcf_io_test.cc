#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include "group_mask.h"
#include "grpaf_exception.h"
#include "htslib/vcf.h"
#include "info_header_builder.h"
#include "info_tag.h"
#include "record_annotator.h"
#include "vcf_loader.h"
#include "vcf_writer.h"

static const char s_vcf[] =
    "data:,"
    "##fileformat=VCFv4.2\n"
    "##contig=<ID=chr1,length=1000>\n"
    "##INFO=<ID=DP,Number=1,Type=Integer,Description=\"Depth\">\n"
    "##INFO=<ID=AF_old,Number=1,Type=Float,Description=\"AF on 2 old samples\">\n"
    "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">\n"
    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tA\tB\tC\n"
    "chr1\t100\t.\tA\tG\t.\t.\tDP=10;AF_old=0.5\tGT\t0/1\t1/1\t./.\n"
    "chr1\t200\t.\tC\tT,G\t.\t.\tDP=7\tGT\t0|0\t0\t.\n";

static const char s_multiallelic_vcf[] =
    "data:,"
    "##fileformat=VCFv4.2\n"
    "##contig=<ID=chr1,length=1000>\n"
    "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">\n"
    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tA\tB\tC\n"
    "chr1\t300\t.\tA\tG,T\t.\t.\t.\tGT\t0/1\t1/2\t0/0\n";

class VcfIoTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        _out = ::testing::TempDir() + "grpaf_vcf_io_test.vcf";
        _out2 = ::testing::TempDir() + "grpaf_vcf_io_test.2.vcf";
        _membership.add("A", "g1");
        _membership.add("B", "g1");
        _membership.add("C", "g2");
    }

    void TearDown() override
    {
        std::remove(_out.c_str());
        std::remove(_out2.c_str());
    }

    uint64_t annotate(const std::string& in, const std::string& out, std::vector<std::string>* stale = nullptr);

    static std::vector<std::string> header_lines(const std::string& path, const std::string& prefix);

    std::string _out;
    std::string _out2;
    grpaf::GroupMembership _membership;
};

uint64_t VcfIoTest::annotate(const std::string& in, const std::string& out, std::vector<std::string>* stale)
{
    VcfLoader loader;
    loader.initialization(in);
    grpaf::GroupMasks masks = grpaf::GroupMaskBuilder::build(loader.samples(), _membership);
    grpaf::InfoTagVector tags = grpaf::parse_info_tags("all");
    grpaf::InfoHeaderBuilder builder;
    grpaf::InfoDescriptors descriptors = builder.add_groups(masks, tags).finalize();

    VcfWriter writer(6);
    writer.start(out, loader.header(), descriptors, "annotate", "grpaf annotate -l \"labels.tsv\"");
    if (stale) {
        *stale = writer.stale_tags();
    }

    grpaf::RecordAnnotator annotator{masks, descriptors, grpaf::needs_hwe(tags)};
    grpaf::GenotypeVector genotypes;
    bcf1_t* b = nullptr;
    while (nullptr != (b = loader.next())) {
        loader.genotypes(genotypes);
        writer.write(b, annotator.annotate(genotypes, b->n_allele - 1, loader.locus()));
    }
    writer.close_file();
    return writer.records_written();
}

std::vector<std::string> VcfIoTest::header_lines(const std::string& path, const std::string& prefix)
{
    std::vector<std::string> result;
    std::ifstream ifs(path);
    std::string line;
    while (std::getline(ifs, line) && line.rfind("##", 0) == 0) {
        if (line.rfind(prefix, 0) == 0) {
            result.push_back(line);
        }
    }
    return result;
}

TEST_F(VcfIoTest, LoaderSamplesAndGenotypes)
{
    VcfLoader loader;
    loader.initialization(s_vcf);
    EXPECT_EQ((grpaf::SampleOrder{"A", "B", "C"}), loader.samples());

    grpaf::GenotypeVector genotypes;
    ASSERT_NE(nullptr, loader.next());
    EXPECT_EQ("chr1:100", loader.locus());
    loader.genotypes(genotypes);
    ASSERT_EQ(3u, genotypes.size());
    EXPECT_EQ(grpaf::NormalizedGenotype::diploid(0, 1), genotypes[0]);
    EXPECT_TRUE(genotypes[2].is_missing());

    ASSERT_NE(nullptr, loader.next());
    loader.genotypes(genotypes);
    EXPECT_EQ(grpaf::NormalizedGenotype::hemizygous(0), genotypes[1]);
    EXPECT_TRUE(genotypes[2].is_missing());

    EXPECT_EQ(nullptr, loader.next());
    EXPECT_EQ(2u, loader.records_read());
}

TEST_F(VcfIoTest, MissingInput)
{
    VcfLoader loader;
    EXPECT_THROW(loader.initialization(::testing::TempDir() + "grpaf_no_such_input.vcf"), grpaf::InputError);
}

TEST_F(VcfIoTest, AnnotateRoundTrip)
{
    std::vector<std::string> stale;
    EXPECT_EQ(2u, annotate(s_vcf, _out, &stale));
    EXPECT_EQ((std::vector<std::string>{"AF_old"}), stale);

    VcfLoader loader;
    loader.initialization(_out);
    bcf_hdr_t* hdr = loader.header();
    EXPECT_LT(bcf_hdr_id2int(hdr, BCF_DT_ID, "AF_old"), 0);
    EXPECT_GE(bcf_hdr_id2int(hdr, BCF_DT_ID, "AF_g1"), 0);
    EXPECT_EQ(1u, header_lines(_out, "##grpafCommandLine=<ID=annotate,").size());

    int32_t* ivals = nullptr;
    float* fvals = nullptr;
    int32_t ni = 0, nf = 0;

    bcf1_t* b = loader.next();
    ASSERT_NE(nullptr, b);
    ASSERT_EQ(1, bcf_get_info_float(hdr, b, "AF_g1", &fvals, &nf));
    EXPECT_FLOAT_EQ(0.75f, fvals[0]);
    ASSERT_EQ(1, bcf_get_info_int32(hdr, b, "AC_g1", &ivals, &ni));
    EXPECT_EQ(3, ivals[0]);
    ASSERT_EQ(1, bcf_get_info_int32(hdr, b, "N_MISS_g2", &ivals, &ni));
    EXPECT_EQ(1, ivals[0]);
    ASSERT_EQ(1, bcf_get_info_int32(hdr, b, "DP", &ivals, &ni));
    EXPECT_EQ(10, ivals[0]);
    EXPECT_LT(bcf_get_info_float(hdr, b, "AF_old", &fvals, &nf), 0);

    b = loader.next();
    ASSERT_NE(nullptr, b);
    ASSERT_EQ(2, bcf_get_info_int32(hdr, b, "AC_g1", &ivals, &ni));
    EXPECT_EQ(0, ivals[0]);
    EXPECT_EQ(0, ivals[1]);
    ASSERT_EQ(1, bcf_get_info_int32(hdr, b, "AN_g1", &ivals, &ni));
    EXPECT_EQ(3, ivals[0]);
    ASSERT_EQ(1, bcf_get_info_int32(hdr, b, "N_HEMI_g1", &ivals, &ni));
    EXPECT_EQ(1, ivals[0]);
    ASSERT_EQ(1, bcf_get_info_int32(hdr, b, "N_HOMREF_g1", &ivals, &ni));
    EXPECT_EQ(1, ivals[0]);
    ASSERT_EQ(1, bcf_get_info_int32(hdr, b, "AN_g2", &ivals, &ni));
    EXPECT_EQ(0, ivals[0]);

    free(ivals);
    free(fvals);
}

TEST_F(VcfIoTest, ReannotateIsIdempotent)
{
    annotate(s_vcf, _out);
    std::vector<std::string> stale;
    EXPECT_EQ(2u, annotate(_out, _out2, &stale));
    EXPECT_EQ(2 * grpaf::k_info_tag_count, stale.size());

    EXPECT_EQ(1u, header_lines(_out2, "##INFO=<ID=AF_g1,").size());
    EXPECT_EQ(1u, header_lines(_out2, "##grpafCommandLine=").size());
    EXPECT_EQ(header_lines(_out, "##INFO="), header_lines(_out2, "##INFO="));

    VcfLoader loader;
    loader.initialization(_out2);
    float* fvals = nullptr;
    int32_t nf = 0;
    bcf1_t* b = loader.next();
    ASSERT_NE(nullptr, b);
    ASSERT_EQ(1, bcf_get_info_float(loader.header(), b, "AF_g1", &fvals, &nf));
    EXPECT_FLOAT_EQ(0.75f, fvals[0]);
    free(fvals);
}

TEST_F(VcfIoTest, MultiallelicIndexRejected)
{
    try {
        annotate(s_multiallelic_vcf, _out);
        FAIL() << "expected FormatError";
    }
    catch (const grpaf::FormatError& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("chr1:300")) << e.what();
    }
}

TEST(VcfWriterTest, Helpers)
{
    EXPECT_TRUE(VcfWriter::is_gz_file("out.vcf.gz"));
    EXPECT_FALSE(VcfWriter::is_gz_file("out.vcf"));
    EXPECT_FALSE(VcfWriter::is_gz_file("gz"));
    EXPECT_EQ("##grpafCommandLine=<ID=annotate,CommandLine=\"grpaf annotate -t 'AF'\">",
              VcfWriter::generate_command_line("annotate", "grpaf annotate -t \"AF\""));
}
