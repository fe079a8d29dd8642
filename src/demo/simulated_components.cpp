/**
 * @file simulated_components.cpp
 * @brief Simulated assistant collaborators and their registrations.
 */
#include "simulated_components.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace residency::demo
{

using utils::ComponentDef;
using utils::ResidencyError;
using utils::ResidencyManager;

SimulatedModel::SimulatedModel(std::string kind, double footprint_mb)
    : m_kind(std::move(kind)),
      m_weights(static_cast<std::size_t>(std::max(footprint_mb, 0.0) * 1024.0 * 1024.0) + 1,
                std::byte{0x5a})
{
}

void SimulatedModel::close() noexcept
{
    std::vector<std::byte>().swap(m_weights);
}

uint64_t SimulatedModel::run(std::string_view input)
{
    if (!is_open())
    {
        throw std::logic_error(fmt::format("{} used after close()", m_kind));
    }
    ++m_calls;
    uint64_t h = 1469598103934665603ULL;
    for (char c : input)
    {
        h = (h ^ static_cast<unsigned char>(c)) * 1099511628211ULL;
    }
    // Stride through the weights; 4 KiB keeps it to one touch per page.
    for (std::size_t i = 0; i < m_weights.size(); i += 4096)
    {
        h ^= static_cast<uint64_t>(m_weights[i]) + i;
    }
    return h;
}

std::string ChatModel::generate(std::string_view prompt)
{
    const auto h = run(prompt);
    return fmt::format("(reply #{} to \"{}\", seed {:08x})", calls(), prompt,
                       static_cast<uint32_t>(h));
}

std::string SpeechRecognizer::transcribe(std::string_view audio_clip)
{
    run(audio_clip);
    return fmt::format("transcript of {}", audio_clip);
}

std::string VisionModel::describe(std::string_view image)
{
    const auto h = run(image);
    return fmt::format("{} showing {} windows", image, 1 + h % 5);
}

int ObjectDetector::detect(std::string_view image)
{
    return static_cast<int>(run(image) % 12);
}

std::string OcrEngine::read_text(std::string_view image)
{
    run(image);
    return fmt::format("text recognised in {}", image);
}

void DesktopDriver::click(int x, int y)
{
    run(fmt::format("{},{}", x, y));
}

std::vector<std::string> SearchEngine::query(std::string_view terms)
{
    const auto h = run(terms);
    std::vector<std::string> hits;
    for (uint64_t i = 0; i < 1 + h % 3; ++i)
    {
        hits.push_back(fmt::format("result {} for '{}'", i + 1, terms));
    }
    return hits;
}

// ---------------------------------------------------------------------------

const std::vector<DemoComponent> &demo_components()
{
    using std::chrono::seconds;
    static const std::vector<DemoComponent> kComponents{
        {"chat_model", 1600.0, seconds(60)},     {"speech_recognizer", 300.0, seconds(60)},
        {"vision_model", 1400.0, seconds(60)},   {"object_detector", 50.0, seconds(30)},
        {"ocr_engine", 50.0, seconds(30)},       {"desktop_driver", 10.0, seconds(30)},
        {"search_engine", 10.0, seconds(30)},
    };
    return kComponents;
}

namespace
{
template <typename T>
void register_simulated(ResidencyManager &manager, const DemoComponent &c,
                        const SimulationOptions &options)
{
    const double footprint = c.estimated_memory_mb * options.footprint_scale;
    const auto delay = options.load_delay;
    std::string kind = c.name;

    ComponentDef def(c.name);
    def.set_loader<T>(
        [kind, footprint, delay]
        {
            std::this_thread::sleep_for(delay);
            return std::make_shared<T>(kind, footprint);
        });
    def.set_unloader<T>([](T &model) { model.close(); });
    def.set_estimated_memory_mb(c.estimated_memory_mb);
    def.set_idle_timeout(c.idle_timeout);
    manager.register_component(std::move(def));
}
} // namespace

void register_demo_components(ResidencyManager &manager, const SimulationOptions &options)
{
    const auto &c = demo_components();
    register_simulated<ChatModel>(manager, c[0], options);
    register_simulated<SpeechRecognizer>(manager, c[1], options);
    register_simulated<VisionModel>(manager, c[2], options);
    register_simulated<ObjectDetector>(manager, c[3], options);
    register_simulated<OcrEngine>(manager, c[4], options);
    register_simulated<DesktopDriver>(manager, c[5], options);
    register_simulated<SearchEngine>(manager, c[6], options);
}

// ---------------------------------------------------------------------------

template <typename T, typename Fn> auto Assistant::with_component(std::string_view name, Fn &&fn)
{
    using Result = std::invoke_result_t<Fn, T &>;
    std::optional<Result> result;
    try
    {
        auto component = m_manager.acquire<T>(name);
        result = fn(*component);
        m_manager.schedule_eviction(name);
    }
    catch (const ResidencyError &e)
    {
        LOGGER_WARN("assistant: '{}' unavailable ({}): {}", name, utils::to_string(e.code()),
                    e.what());
    }
    return result;
}

std::optional<std::string> Assistant::chat(std::string_view prompt)
{
    return with_component<ChatModel>("chat_model",
                                     [&](ChatModel &m) { return m.generate(prompt); });
}

std::optional<std::string> Assistant::transcribe(std::string_view audio_clip)
{
    return with_component<SpeechRecognizer>(
        "speech_recognizer", [&](SpeechRecognizer &m) { return m.transcribe(audio_clip); });
}

std::optional<std::string> Assistant::describe_screen()
{
    return with_component<VisionModel>("vision_model",
                                       [](VisionModel &m) { return m.describe("screenshot"); });
}

std::optional<int> Assistant::detect_objects()
{
    return with_component<ObjectDetector>("object_detector",
                                          [](ObjectDetector &m) { return m.detect("screenshot"); });
}

std::optional<std::string> Assistant::read_screen_text()
{
    return with_component<OcrEngine>("ocr_engine",
                                     [](OcrEngine &m) { return m.read_text("screenshot"); });
}

std::optional<std::string> Assistant::click(int x, int y)
{
    return with_component<DesktopDriver>("desktop_driver",
                                         [&](DesktopDriver &m)
                                         {
                                             m.click(x, y);
                                             return fmt::format("clicked at ({}, {})", x, y);
                                         });
}

std::optional<std::vector<std::string>> Assistant::search(std::string_view terms)
{
    return with_component<SearchEngine>("search_engine",
                                        [&](SearchEngine &m) { return m.query(terms); });
}

} // namespace residency::demo
