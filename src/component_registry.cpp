#include <pulse/component_registry.h>

#include <pulse/markdown_reporter.h>
#include <pulse/yaml_event_source.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kDefaultEventSource[] = "yaml";
constexpr const char kDefaultReporter[] = "markdown";

} // namespace

namespace pulse {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Factory>
const Factory &ComponentRegistry::FindFactory(const std::string &name,
                                              const ComponentSet<Factory> &set,
                                              const std::string &kind) {
  const auto target_name = name.empty() ? set.default_name : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(target_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + target_name +
                                "'. Registered: " + JoinNames(set));
  }
  return found->second;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RegisterEventSource(const std::string &name,
                                            EventSourceFactory factory,
                                            bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, event_sources_);
}

void ComponentRegistry::RegisterReporter(const std::string &name,
                                         ReporterFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, reporters_);
}

std::unique_ptr<EventSource> ComponentRegistry::CreateEventSource(
    const std::string &name, const std::filesystem::path &location) const {
  const auto &factory = FindFactory(name, event_sources_, "event source");
  auto instance = factory(location);
  if (!instance) {
    throw std::runtime_error("Factory for event source '" +
                             (name.empty() ? event_sources_.default_name
                                           : name) +
                             "' returned null");
  }
  return instance;
}

std::unique_ptr<Reporter>
ComponentRegistry::CreateReporter(const std::string &name) const {
  const auto &factory = FindFactory(name, reporters_, "reporter");
  auto instance = factory();
  if (!instance) {
    throw std::runtime_error(
        "Factory for reporter '" +
        (name.empty() ? reporters_.default_name : name) + "' returned null");
  }
  return instance;
}

std::vector<std::string> ComponentRegistry::EventSourceNames() const {
  return RegisteredNames(event_sources_);
}

std::vector<std::string> ComponentRegistry::ReporterNames() const {
  return RegisteredNames(reporters_);
}

const std::string &ComponentRegistry::DefaultEventSourceName() const {
  return event_sources_.default_name;
}

const std::string &ComponentRegistry::DefaultReporterName() const {
  return reporters_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterEventSource(
      kDefaultEventSource,
      [](const std::filesystem::path &location) {
        return std::make_unique<YamlEventSource>(location);
      },
      true);
  registry.RegisterReporter(
      kDefaultReporter, []() { return std::make_unique<MarkdownReporter>(); },
      true);
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace pulse
