// tests/test_framework/shared_test_helpers.cpp
/**
 * @file shared_test_helpers.cpp
 * @brief Implements common helper functions for test cases.
 */
#include "shared_test_helpers.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace residency::tests::helper
{

bool read_file_contents(const std::string &path, std::string &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

size_t count_lines(std::string_view text, std::optional<std::string_view> must_include,
                   std::optional<std::string_view> must_exclude)
{
    size_t count = 0;
    size_t pos = 0;

    while (pos < text.size())
    {
        auto end = text.find('\n', pos);
        auto line = text.substr(pos, end - pos);

        if ((!must_include || line.find(*must_include) != std::string_view::npos) &&
            (!must_exclude || line.find(*must_exclude) == std::string_view::npos))
        {
            ++count;
        }

        if (end == std::string_view::npos)
            break;
        pos = end + 1;
    }

    return count;
}

fs::path unique_temp_path(const std::string &stem, const std::string &extension)
{
    auto p = fs::temp_directory_path() /
             fmt::format("residency_test_{}_{}_{}{}", stem, residency::platform::get_pid(),
                         residency::platform::monotonic_time_ns(), extension);
    std::error_code ec;
    fs::remove(p, ec);
    return p;
}

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4996) // 'getenv': This function or variable may be unsafe.
#endif
std::string test_scale()
{
    const char *v = std::getenv("RESIDENCY_TEST_SCALE");
    return v ? std::string(v) : std::string();
}
#if defined(_MSC_VER)
#pragma warning(pop)
#endif

int scaled_value(int original, int small_value)
{
    if (test_scale() == "small")
        return small_value;
    return original;
}

} // namespace residency::tests::helper
