#pragma once
/**
 * @file simulated_components.hpp
 * @brief Stand-ins for the heavy collaborators of a desktop assistant.
 *
 * Each component holds a buffer sized from its advertised memory footprint (scaled
 * down) and takes a moment to "load", so the residency manager's effect is visible in
 * the process RSS without needing real models on disk.
 */
#include "rsd_service.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace residency::demo
{

class SimulatedModel
{
  public:
    SimulatedModel(std::string kind, double footprint_mb);
    virtual ~SimulatedModel() = default;

    SimulatedModel(const SimulatedModel &) = delete;
    SimulatedModel &operator=(const SimulatedModel &) = delete;

    /// Releases the weight buffer. Further calls to run() fail.
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return !m_weights.empty(); }
    [[nodiscard]] std::size_t footprint_bytes() const noexcept { return m_weights.size(); }
    [[nodiscard]] const std::string &kind() const noexcept { return m_kind; }
    [[nodiscard]] uint64_t calls() const noexcept { return m_calls; }

  protected:
    /// Touches the weights and returns a checksum-like value so the work is not elided.
    uint64_t run(std::string_view input);

  private:
    std::string m_kind;
    std::vector<std::byte> m_weights;
    uint64_t m_calls{0};
};

class ChatModel : public SimulatedModel
{
  public:
    using SimulatedModel::SimulatedModel;
    std::string generate(std::string_view prompt);
};

class SpeechRecognizer : public SimulatedModel
{
  public:
    using SimulatedModel::SimulatedModel;
    std::string transcribe(std::string_view audio_clip);
};

class VisionModel : public SimulatedModel
{
  public:
    using SimulatedModel::SimulatedModel;
    std::string describe(std::string_view image);
};

class ObjectDetector : public SimulatedModel
{
  public:
    using SimulatedModel::SimulatedModel;
    int detect(std::string_view image);
};

class OcrEngine : public SimulatedModel
{
  public:
    using SimulatedModel::SimulatedModel;
    std::string read_text(std::string_view image);
};

class DesktopDriver : public SimulatedModel
{
  public:
    using SimulatedModel::SimulatedModel;
    void click(int x, int y);
};

class SearchEngine : public SimulatedModel
{
  public:
    using SimulatedModel::SimulatedModel;
    std::vector<std::string> query(std::string_view terms);
};

/// Static description of one demo component.
struct DemoComponent
{
    const char *name;
    double estimated_memory_mb;
    std::chrono::milliseconds idle_timeout;
};

/// The components registered by register_demo_components(), in registration order.
const std::vector<DemoComponent> &demo_components();

struct SimulationOptions
{
    /// Fraction of the advertised footprint actually allocated.
    double footprint_scale{0.01};
    /// How long each loader sleeps to imitate reading a model from disk.
    std::chrono::milliseconds load_delay{std::chrono::milliseconds(150)};
};

void register_demo_components(utils::ResidencyManager &manager,
                              const SimulationOptions &options = {});

/**
 * @brief The assistant front end: one method per user request.
 *
 * Every request acquires what it needs, does its work, then re-arms the component's
 * idle timer. A component that cannot be acquired is reported as unavailable and the
 * request returns std::nullopt.
 */
class Assistant
{
  public:
    explicit Assistant(utils::ResidencyManager &manager) : m_manager(manager) {}

    std::optional<std::string> chat(std::string_view prompt);
    std::optional<std::string> transcribe(std::string_view audio_clip);
    std::optional<std::string> describe_screen();
    std::optional<int> detect_objects();
    std::optional<std::string> read_screen_text();
    std::optional<std::string> click(int x, int y);
    std::optional<std::vector<std::string>> search(std::string_view terms);

  private:
    template <typename T, typename Fn> auto with_component(std::string_view name, Fn &&fn);

    utils::ResidencyManager &m_manager;
};

} // namespace residency::demo
