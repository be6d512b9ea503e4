#include "function_declaration.hpp"

#include <yaml-cpp/yaml.h>

#include <set>

#include "internal/util/errors.hpp"

namespace fnpipe::model {

namespace {

using fnpipe::util::DeclarationParseError;

class DeclarationParser {
 public:
  explicit DeclarationParser(const Resource& source) : context_(Context(source)) {
  }

  [[noreturn]] void Fail(const std::string& reason) const {
    throw DeclarationParseError(context_ + ": " + reason);
  }

  void RequireKnownKeys(const YAML::Node& map, const std::set<std::string>& allowed, const std::string& where) const {
    for (const auto& entry : map) {
      const auto key = entry.first.Scalar();
      if (allowed.count(key) == 0) {
        Fail("unknown field '" + key + "' in " + where);
      }
    }
  }

  std::string RequiredString(const YAML::Node& map, const char* key, const std::string& where) const {
    const YAML::Node value = map[key];
    if (!value || !value.IsScalar() || value.Scalar().empty()) {
      Fail(where + "." + key + " must be a non-empty string");
    }
    return value.Scalar();
  }

  std::string OptionalString(const YAML::Node& map, const char* key, const std::string& where) const {
    const YAML::Node value = map[key];
    if (!value || value.IsNull()) {
      return {};
    }
    if (!value.IsScalar()) {
      Fail(where + "." + key + " must be a string");
    }
    return value.Scalar();
  }

  std::optional<bool> OptionalBool(const YAML::Node& map, const char* key, const std::string& where) const {
    const YAML::Node value = map[key];
    if (!value || value.IsNull()) {
      return std::nullopt;
    }
    if (!value.IsScalar() || value.Tag() == "!") {
      Fail(where + "." + key + " must be a boolean");
    }
    try {
      return value.as<bool>();
    } catch (const YAML::BadConversion&) {
      Fail(where + "." + key + " must be a boolean, got '" + value.Scalar() + "'");
    }
  }

  std::vector<std::string> StringList(const YAML::Node& map, const char* key, const std::string& where) const {
    std::vector<std::string> out;
    const YAML::Node         value = map[key];
    if (!value || value.IsNull()) {
      return out;
    }
    if (!value.IsSequence()) {
      Fail(where + "." + key + " must be a list of strings");
    }
    for (const auto& element : value) {
      if (!element.IsScalar()) {
        Fail(where + "." + key + " must be a list of strings");
      }
      out.push_back(element.Scalar());
    }
    return out;
  }

  ContainerRuntime ParseContainer(const YAML::Node& node) const {
    if (!node.IsMap()) {
      Fail("container must be a mapping");
    }
    RequireKnownKeys(node, {"image", "network", "env", "mounts", "storageMounts"}, "container");

    ContainerRuntime container;
    container.image   = RequiredString(node, "image", "container");
    container.network = OptionalBool(node, "network", "container");
    container.env     = StringList(node, "env", "container");
    for (const auto& entry : container.env) {
      if (entry.empty() || entry.front() == '=') {
        Fail("container.env entries must be KEY or KEY=VALUE");
      }
    }

    const char* mounts_key = node["mounts"] ? "mounts" : "storageMounts";
    const YAML::Node mounts = node[mounts_key];
    if (mounts && !mounts.IsNull()) {
      if (!mounts.IsSequence()) {
        Fail(std::string("container.") + mounts_key + " must be a list");
      }
      for (const auto& element : mounts) {
        container.mounts.push_back(ParseMount(element));
      }
    }
    return container;
  }

  ContainerMount ParseMount(const YAML::Node& node) const {
    if (!node.IsMap()) {
      Fail("container mounts must be mappings");
    }
    RequireKnownKeys(node, {"type", "src", "dst", "rw"}, "mount");

    ContainerMount mount;
    mount.type = RequiredString(node, "type", "mount");
    if (mount.type != "bind" && mount.type != "volume" && mount.type != "tmpfs") {
      Fail("mount.type must be one of bind, volume, tmpfs");
    }
    mount.target = RequiredString(node, "dst", "mount");
    mount.source = mount.type == "tmpfs" ? OptionalString(node, "src", "mount") : RequiredString(node, "src", "mount");
    mount.read_write = OptionalBool(node, "rw", "mount").value_or(false);
    return mount;
  }

  ExecRuntime ParseExec(const YAML::Node& node) const {
    if (!node.IsMap()) {
      Fail("exec must be a mapping");
    }
    RequireKnownKeys(node, {"path", "args"}, "exec");

    ExecRuntime exec;
    exec.path = RequiredString(node, "path", "exec");
    exec.args = StringList(node, "args", "exec");
    return exec;
  }

 private:
  static std::string Context(const Resource& source) {
    std::string context = "function declaration on " + source.Identity().ToString();
    if (source.provenance().HasPath()) {
      context += " (" + source.provenance().path + ")";
    }
    return context;
  }

  std::string context_;
};

} // namespace

std::string FunctionDeclaration::Name() const {
  if (const auto* container = std::get_if<ContainerRuntime>(&runtime)) {
    return container->image;
  }
  return std::get<ExecRuntime>(runtime).path;
}

std::optional<std::string> FindDeclarationAnnotation(const Resource& resource) {
  if (auto value = resource.Annotation(kFunctionAnnotation)) {
    return value;
  }
  return resource.Annotation(kLegacyFunctionAnnotation);
}

FunctionDeclaration ParseDeclaration(const Resource& source, const std::string& annotation) {
  DeclarationParser parser(source);

  if (source.Identity().name.empty()) {
    parser.Fail("declaring resource must have metadata.name");
  }

  YAML::Node root;
  try {
    root = YAML::Load(annotation);
  } catch (const YAML::Exception& e) {
    parser.Fail(std::string("annotation is not valid YAML: ") + e.what());
  }

  const YAML::Node& spec = root;
  if (!spec.IsMap()) {
    parser.Fail("annotation value must be a mapping");
  }
  if (spec["starlark"]) {
    parser.Fail("starlark functions are not supported");
  }
  parser.RequireKnownKeys(spec, {"container", "exec", "deferFailure"}, "declaration");

  const bool has_container = static_cast<bool>(spec["container"]);
  const bool has_exec      = static_cast<bool>(spec["exec"]);
  if (has_container == has_exec) {
    parser.Fail("exactly one of container or exec must be set");
  }

  FunctionDeclaration declaration{
      has_container ? RuntimeSpec{parser.ParseContainer(spec["container"])} : RuntimeSpec{parser.ParseExec(spec["exec"])},
      parser.OptionalBool(spec, "deferFailure", "declaration").value_or(false),
      source.Clone(),
  };
  return declaration;
}

} // namespace fnpipe::model
