#include <quadrature/error_code.hpp>

#include <string>

namespace quadrature {

namespace {

class QuadratureErrorCategory : public std::error_category {
   public:
    const char* name() const noexcept override {
        return "quadrature";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::invalid_transition:
                return "invalid quadrature transition";
            case errc::pin_read:
                return "pin read failed";
        }
        return "unknown quadrature error";
    }
};

}  // namespace

const std::error_category& errorCategory() {
    static QuadratureErrorCategory category;
    return category;
}

}  // namespace quadrature
