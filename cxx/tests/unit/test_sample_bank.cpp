#include <gtest/gtest.h>
#include "TestHelper.hpp"
#include "core/SampleBank.hpp"
#include <sndfile.hh>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

using namespace keyfall;
namespace fs = std::filesystem;

class SampleBankTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("keyfall_bank_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    void write_wav(const std::string& name, int channels, int rate, const std::vector<float>& interleaved) {
        SndfileHandle file((dir_ / name).string(), SFM_WRITE, SF_FORMAT_WAV | SF_FORMAT_FLOAT, channels, rate);
        ASSERT_EQ(file.error(), SF_ERR_NO_ERROR);
        file.write(interleaved.data(), static_cast<sf_count_t>(interleaved.size()));
    }

    fs::path dir_;
};

TEST_F(SampleBankTest, LoadsNumberedFilesAsStereo) {
    write_wav("001.wav", 1, 44100, std::vector<float>(100, 0.5f));
    std::vector<float> stereo;
    for (int i = 0; i < 50; ++i) {
        stereo.push_back(0.25f);
        stereo.push_back(-0.25f);
    }
    write_wav("003.wav", 2, 44100, stereo);

    SampleBank bank = SampleBank::load(dir_.string(), {40, 3});
    EXPECT_EQ(bank.size(), 2u);
    EXPECT_EQ(bank.sample_rate(), 44100);

    const Sample* mono = bank.find(40);
    ASSERT_NE(mono, nullptr);
    EXPECT_EQ(mono->frames(), 100u);
    EXPECT_FLOAT_EQ(mono->data[0], 0.5f);
    EXPECT_FLOAT_EQ(mono->data[1], 0.5f);

    EXPECT_EQ(bank.find(41), nullptr);

    const Sample* wide = bank.find(42);
    ASSERT_NE(wide, nullptr);
    EXPECT_EQ(wide->frames(), 50u);
    EXPECT_FLOAT_EQ(wide->data[0], 0.25f);
    EXPECT_FLOAT_EQ(wide->data[1], -0.25f);
}

TEST_F(SampleBankTest, SkipsFilesAtAnotherRate) {
    write_wav("001.wav", 1, 44100, std::vector<float>(10, 0.1f));
    write_wav("002.wav", 1, 48000, std::vector<float>(10, 0.1f));

    SampleBank bank = SampleBank::load(dir_.string(), {60, 2});
    EXPECT_EQ(bank.size(), 1u);
    EXPECT_NE(bank.find(60), nullptr);
    EXPECT_EQ(bank.find(61), nullptr);
}

TEST_F(SampleBankTest, SkipsUnreadableFiles) {
    {
        std::ofstream junk(dir_ / "001.wav");
        junk << "this is not audio";
    }
    write_wav("002.wav", 1, 22050, std::vector<float>(10, 0.1f));

    SampleBank bank = SampleBank::load(dir_.string(), {60, 2});
    EXPECT_EQ(bank.size(), 1u);
    EXPECT_EQ(bank.sample_rate(), 22050);
    EXPECT_NE(bank.find(61), nullptr);
}

TEST_F(SampleBankTest, EmptyDirectoryIsFatal) {
    EXPECT_THROW(SampleBank::load(dir_.string()), std::runtime_error);
    EXPECT_THROW(SampleBank::load((dir_ / "missing").string()), std::runtime_error);
}

TEST(SampleBankFromSamplesTest, ValidatesInput) {
    EXPECT_THROW(SampleBank::from_samples({}, 44100), std::runtime_error);

    std::map<int, Sample> bad;
    bad[128] = test::constant_sample(10, 0.1f);
    EXPECT_THROW(SampleBank::from_samples(std::move(bad), 44100), std::runtime_error);

    std::map<int, Sample> good;
    good[72] = test::constant_sample(10, 0.1f);
    SampleBank bank = SampleBank::from_samples(std::move(good), 48000);
    EXPECT_EQ(bank.size(), 1u);
    EXPECT_EQ(bank.sample_rate(), 48000);
    EXPECT_NE(bank.find(72), nullptr);
    EXPECT_EQ(bank.find(-5), nullptr);
    EXPECT_EQ(bank.find(500), nullptr);
}
