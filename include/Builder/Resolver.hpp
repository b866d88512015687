#pragma once

#include "Builder/BuildProfile.hpp"
#include "Dependency.hpp"
#include "Manifest.hpp"

#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <vector>

namespace weld {

namespace fs = std::filesystem;

// A component with every template and profile indirection flattened out.
struct ResolvedComponent {
  std::string name;
  // Unset when neither the component nor its template declares profiles.
  std::optional<std::string> profile;
  fs::path baseDir;
  ComponentProperties properties;
  std::vector<ComponentDependency> dependencies;
};

// Layers `overrides` on top of `base`:
//   - scalar paths and componentType: the override wins when set
//   - build, clean, files: taken wholesale from the override when set
//   - customCommands: merged by name, each entry taken wholesale
ComponentProperties mergeProperties(const ComponentProperties& base,
                                    const ComponentProperties& overrides);

class Resolver {
public:
  // Checks every template chain, component template reference, component
  // name and dependency owner up front, so resolution itself only fails on
  // profile selection.
  static rs::Result<Resolver> create(const Manifest& manifest) noexcept;

  rs::Result<ResolvedComponent>
  resolve(const ComponentDefinition& component,
          const std::optional<BuildProfile>& profile) const noexcept;

  // In declaration order.
  rs::Result<std::vector<ResolvedComponent>>
  resolveAll(const std::optional<BuildProfile>& profile) const noexcept;

  // Sorted names of every profile selectable for `component`.
  std::vector<std::string>
  profileNames(const ComponentDefinition& component) const;

private:
  explicit Resolver(const Manifest& manifest) noexcept : manifest(&manifest) {}

  // The concrete (non-reference) template `name` leads to.
  const ComponentTemplate& concreteTemplate(const std::string& name) const;

  const Manifest* manifest;
};

} // namespace weld
