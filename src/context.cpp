#include "txcopy/context.h"
#include "txcopy/log.h"

namespace txcopy {

StepContext StepContext::local(ToolOptions opts) {
    StepContext ctx;
    ctx.logger       = default_logger();
    ctx.probe        = std::make_shared<LocalFileProbe>();
    ctx.sync         = std::make_shared<RsyncTool>(opts, ctx.logger);
    ctx.owner        = std::make_shared<ChownTool>(opts, ctx.logger);
    ctx.is_superuser = &running_as_superuser;
    return ctx;
}

StepContext StepContext::with_defaults(ToolOptions opts) const {
    StepContext ctx = *this;
    if (!ctx.logger)       ctx.logger = default_logger();
    if (!ctx.probe)        ctx.probe = std::make_shared<LocalFileProbe>();
    if (!ctx.sync)         ctx.sync = std::make_shared<RsyncTool>(opts, ctx.logger);
    if (!ctx.owner)        ctx.owner = std::make_shared<ChownTool>(opts, ctx.logger);
    if (!ctx.is_superuser) ctx.is_superuser = &running_as_superuser;
    return ctx;
}

} // namespace txcopy
