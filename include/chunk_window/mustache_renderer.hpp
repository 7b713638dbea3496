#pragma once
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cw {

// Flat view handed to a template: {{name}} scalars, {{#name}}...{{/name}}
// sections over rows, and {{#flag}} booleans.
struct TemplateContext {
  using Row = std::map<std::string, std::string>;

  std::map<std::string, std::string> scalars;
  std::map<std::string, bool> flags;
  std::map<std::string, std::vector<Row>> lists;

  void set(std::string key, std::string value) { scalars[std::move(key)] = std::move(value); }
};

class MustacheRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string partials_dir = "templates/partials";
    std::vector<std::string> static_css;
  };

  MustacheRenderer();
  explicit MustacheRenderer(Config cfg);

  // Every <partials_dir>/<name>.mustache is available as {{> name}}.
  bool render_to_file(std::string_view template_name,
                      const TemplateContext& ctx,
                      std::string_view out_path);

  bool render_to_dir(std::string_view template_name,
                     const TemplateContext& ctx,
                     std::string_view out_dir,
                     std::string_view out_name,
                     bool copy_assets);

  const std::string& last_error() const noexcept { return err_; }

private:
  Config cfg_;
  std::string err_;
};

}
