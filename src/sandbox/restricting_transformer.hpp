#pragma once

#include <string>
#include <vector>

#include <pybind11/pybind11.h>

namespace codeact::sandbox {

// Deny-by-default rewrite of a module parsed by the embedded interpreter's
// `ast` module. Node kinds without a handler are rejected; names and
// attributes starting with "_" are rejected; attribute reads go through the
// `_getattr_` guard and attribute writes through the `_write_` guard. All
// rejections of one module are reported together as a SyntaxRejection.
// Callers hold the GIL.
class RestrictingTransformer {
public:
    virtual ~RestrictingTransformer() = default;

    // Parses, transforms and compiles `source`. Parse failures propagate as
    // a Python SyntaxError.
    pybind11::object Compile(const std::string& source, const std::string& filename);
    // Checks `tree` and rewrites it in place.
    void Transform(pybind11::handle tree);

protected:
    // The switch over node kinds. Returns false for kinds it has no handler
    // for; the caller rejects those.
    virtual bool VisitNode(const std::string& kind, pybind11::handle node);

    void Visit(pybind11::handle node);
    void VisitChildren(pybind11::handle node);
    void CheckName(const std::string& name);
    void CheckOptionalName(pybind11::handle name);
    void CheckAttributeName(const std::string& name);
    void Reject(const std::string& message);

private:
    void VisitFunctionDef(pybind11::handle node);
    void VisitClassDef(pybind11::handle node);
    void VisitAlias(pybind11::handle node);
    void CheckFinallyBody(pybind11::handle body, bool in_loop);
    pybind11::object Rewrite(pybind11::handle node);

    pybind11::object ast_;
    std::vector<std::string> errors_;
    int line_ = 0;
    int class_depth_ = 0;
};

// Additionally accepts annotated assignments and match statements with
// their patterns.
class PermissiveRestrictingTransformer : public RestrictingTransformer {
protected:
    bool VisitNode(const std::string& kind, pybind11::handle node) override;
};

}  // namespace codeact::sandbox
