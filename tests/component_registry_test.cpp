#include <pulse/component_registry.h>
#include <pulse/markdown_reporter.h>
#include <pulse/yaml_event_source.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>

namespace pulse {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class CustomReporter : public Reporter {
public:
  Rendering Render(const Report &, const RenderOptions &) override {
    return Rendering{"custom-report", "custom-json"};
  }
};

class EmptySource : public EventSource {
public:
  explicit EmptySource(std::filesystem::path location)
      : location_(std::move(location)) {}

  RawEventBatch Fetch(const Period &) override { return RawEventBatch{}; }

  const std::filesystem::path &location() const { return location_; }

private:
  std::filesystem::path location_;
};

TEST(ComponentRegistryTest,
     ProvidesDefaultsAndKeepsThemAfterCustomRegistration) {
  auto registry = MakeComponentRegistryWithDefaults();

  auto default_source = registry.CreateEventSource("", "events.yaml");
  EXPECT_NE(dynamic_cast<YamlEventSource *>(default_source.get()), nullptr);
  auto default_reporter = registry.CreateReporter();
  EXPECT_NE(dynamic_cast<MarkdownReporter *>(default_reporter.get()), nullptr);

  registry.RegisterReporter(
      "custom-reporter", []() { return std::make_unique<CustomReporter>(); });

  auto still_default = registry.CreateReporter();
  EXPECT_NE(dynamic_cast<MarkdownReporter *>(still_default.get()), nullptr);
  EXPECT_EQ(registry.DefaultReporterName(), "markdown");

  auto custom_instance = registry.CreateReporter("custom-reporter");
  ASSERT_NE(dynamic_cast<CustomReporter *>(custom_instance.get()), nullptr);
  EXPECT_EQ(custom_instance->Render(Report{}, RenderOptions{}).markdown,
            "custom-report");
  EXPECT_THAT(registry.ReporterNames(),
              ElementsAre("custom-reporter", "markdown"));
}

TEST(ComponentRegistryTest, PassesLocationToEventSourceFactory) {
  auto registry = MakeComponentRegistryWithDefaults();
  registry.RegisterEventSource(
      "empty",
      [](const std::filesystem::path &location) {
        return std::make_unique<EmptySource>(location);
      },
      true);

  EXPECT_EQ(registry.DefaultEventSourceName(), "empty");
  auto source = registry.CreateEventSource("", "/tmp/events");
  auto *empty = dynamic_cast<EmptySource *>(source.get());
  ASSERT_NE(empty, nullptr);
  EXPECT_EQ(empty->location(), std::filesystem::path("/tmp/events"));
}

TEST(ComponentRegistryTest, UnknownNameListsRegisteredComponents) {
  const auto registry = MakeComponentRegistryWithDefaults();

  try {
    registry.CreateReporter("html");
    FAIL() << "Expected unknown reporter to throw";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown reporter 'html'"));
    EXPECT_THAT(error.what(), HasSubstr("Registered: markdown"));
  }
  EXPECT_THROW(registry.CreateEventSource("github", "."),
               std::invalid_argument);
}

TEST(ComponentRegistryTest, RejectsDuplicateAndNullRegistrations) {
  auto registry = MakeComponentRegistryWithDefaults();

  EXPECT_THROW(registry.RegisterReporter(
                   "markdown",
                   []() { return std::make_unique<CustomReporter>(); }),
               std::invalid_argument);
  EXPECT_THROW(registry.RegisterReporter("", []() {
    return std::make_unique<CustomReporter>();
  }),
               std::invalid_argument);
  EXPECT_THROW(registry.RegisterReporter("none", nullptr),
               std::invalid_argument);
}

TEST(ComponentRegistryTest, FactoryReturningNullIsAnError) {
  ComponentRegistry registry;
  registry.RegisterReporter("broken",
                            []() { return std::unique_ptr<Reporter>(); });

  EXPECT_THROW(registry.CreateReporter(), std::runtime_error);
}

TEST(ComponentRegistryTest, EmptyRegistryHasNoDefault) {
  const ComponentRegistry registry;

  EXPECT_THROW(registry.CreateReporter(), std::invalid_argument);
  EXPECT_TRUE(registry.EventSourceNames().empty());
}

TEST(ComponentRegistryTest, GlobalRegistryCarriesDefaults) {
  EXPECT_THAT(GlobalComponentRegistry().EventSourceNames(),
              ElementsAre("yaml"));
  EXPECT_THAT(GlobalComponentRegistry().ReporterNames(),
              ElementsAre("markdown"));
}

} // namespace
} // namespace pulse
