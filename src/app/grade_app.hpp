#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace iojudge {

/// `judge grade <source> <spec>`: prints a verdict per test case and a summary
class GradeApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;
};

} // namespace iojudge
