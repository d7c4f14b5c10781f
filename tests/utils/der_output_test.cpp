// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

#include <cerrno>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>
#include <uuid7der/uuid7der_utils.hpp>

using namespace uuid7der;
using namespace uuid7der::utils;

// Test fixture for DER output tests
class DerOutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "uuid7der_output_test";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    static std::vector<uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    std::filesystem::path temp_dir_;
};

const std::array<uint8_t, 4> sample_bytes = {0x30, 0x02, 0x02, 0x00};

TEST_F(DerOutputTest, WriteToPipe) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    {
        DerOutput out(fds[1]);
        EXPECT_TRUE(out.is_open());
        EXPECT_EQ(out.status(), OutputStatus::ready);
        EXPECT_TRUE(out.write(sample_bytes));
        EXPECT_EQ(out.values_written(), 1U);
        EXPECT_EQ(out.bytes_written(), sample_bytes.size());
    }

    // Borrowed descriptor is left open by the sink
    ::close(fds[1]);

    std::array<uint8_t, 8> buffer{};
    ssize_t n = ::read(fds[0], buffer.data(), buffer.size());
    ::close(fds[0]);

    ASSERT_EQ(n, static_cast<ssize_t>(sample_bytes.size()));
    EXPECT_TRUE(std::equal(sample_bytes.begin(), sample_bytes.end(), buffer.begin()));
}

TEST_F(DerOutputTest, WriteToFile) {
    auto path = temp_dir_ / "values.der";

    {
        DerOutput out(path.string());
        EXPECT_TRUE(out.write(sample_bytes));
        EXPECT_TRUE(out.write(sample_bytes));
        EXPECT_EQ(out.values_written(), 2U);
        EXPECT_EQ(out.bytes_written(), 8U);
    }

    auto contents = read_file(path);
    ASSERT_EQ(contents.size(), 8U);
    EXPECT_EQ(contents[0], 0x30);
    EXPECT_EQ(contents[4], 0x30);
}

TEST_F(DerOutputTest, BadPathThrows) {
    auto path = temp_dir_ / "missing" / "values.der";
    EXPECT_THROW(DerOutput out(path.string()), std::runtime_error);
}

TEST_F(DerOutputTest, WriteErrorIsSticky) {
    auto path = temp_dir_ / "readonly.der";
    { std::ofstream touch(path); }

    int fd = ::open(path.c_str(), O_RDONLY);
    ASSERT_GE(fd, 0);

    DerOutput out(fd);
    EXPECT_FALSE(out.write(sample_bytes));
    EXPECT_EQ(out.status(), OutputStatus::write_error);
    EXPECT_EQ(out.last_errno(), EBADF);
    EXPECT_EQ(out.values_written(), 0U);

    IoError err = out.error();
    EXPECT_EQ(err.kind, IoErrorKind::write);
    EXPECT_EQ(err.sys_errno, EBADF);

    // Stays failed until cleared
    EXPECT_FALSE(out.write(sample_bytes));
    out.clear_error();
    EXPECT_EQ(out.status(), OutputStatus::ready);
    EXPECT_EQ(out.last_errno(), 0);

    ::close(fd);
}

TEST_F(DerOutputTest, ClosedRejectsWrites) {
    DerOutput out((temp_dir_ / "closed.der").string());
    out.close();

    EXPECT_FALSE(out.is_open());
    EXPECT_EQ(out.status(), OutputStatus::closed);
    EXPECT_FALSE(out.write(sample_bytes));

    out.clear_error();
    EXPECT_EQ(out.status(), OutputStatus::closed);
}

TEST_F(DerOutputTest, MoveTransfersDescriptor) {
    auto path = temp_dir_ / "moved.der";

    DerOutput first(path.string());
    EXPECT_TRUE(first.write(sample_bytes));

    DerOutput second(std::move(first));
    EXPECT_TRUE(second.is_open());
    EXPECT_EQ(second.values_written(), 1U);
    EXPECT_TRUE(second.write(sample_bytes));
    second.close();

    EXPECT_EQ(read_file(path).size(), 8U);
}

TEST(OutputStatusTest, Strings) {
    EXPECT_STREQ(output_status_string(OutputStatus::ready), "ready");
    EXPECT_STREQ(output_status_string(OutputStatus::disk_full), "disk_full");
    EXPECT_STREQ(output_status_string(OutputStatus::broken_pipe), "broken_pipe");
}
