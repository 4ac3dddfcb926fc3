#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace revhub::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Write to "<p>.tmp" and rename over `p`, so readers never see a torn file.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_file_atomic(const std::filesystem::path& p, std::string_view text);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);

// `expected_size` is the exact inflated length recorded next to the payload.
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data,
                                       std::size_t expected_size);

} // namespace revhub::fs
