#pragma once

#include <pulse/interfaces.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pulse {

class ComponentRegistry {
public:
  using EventSourceFactory = std::function<std::unique_ptr<EventSource>(
      const std::filesystem::path &)>;
  using ReporterFactory = std::function<std::unique_ptr<Reporter>()>;

  void RegisterEventSource(const std::string &name, EventSourceFactory factory,
                           bool set_as_default = false);
  void RegisterReporter(const std::string &name, ReporterFactory factory,
                        bool set_as_default = false);

  std::unique_ptr<EventSource>
  CreateEventSource(const std::string &name,
                    const std::filesystem::path &location) const;
  std::unique_ptr<Reporter> CreateReporter(const std::string &name = "") const;

  std::vector<std::string> EventSourceNames() const;
  std::vector<std::string> ReporterNames() const;

  const std::string &DefaultEventSourceName() const;
  const std::string &DefaultReporterName() const;

  template <typename Factory>
  struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static const Factory &FindFactory(const std::string &name,
                                    const ComponentSet<Factory> &set,
                                    const std::string &kind);

  template <typename Factory>
  void RegisterComponent(const std::string &name, Factory factory,
                         bool set_as_default, ComponentSet<Factory> &set);

  ComponentSet<EventSourceFactory> event_sources_;
  ComponentSet<ReporterFactory> reporters_;
};

// Registers "yaml" as the default event source and "markdown" as the default
// reporter.
ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace pulse
