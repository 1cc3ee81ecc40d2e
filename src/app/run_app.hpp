#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace iojudge {

/// `judge run <source> <inputs>`: prints the transcript of every input set
class RunApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;
};

} // namespace iojudge
