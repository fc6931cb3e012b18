#include "stagedpipe/common/cancellation.hpp"
#include "stagedpipe/common/pipeline_exceptions.hpp"
#include "stagedpipe/common/settings.hpp"
#include "stagedpipe/execution/chain_compiler.hpp"
#include "stagedpipe/model/behavior.hpp"
#include "stagedpipe/model/builder.hpp"
#include "stagedpipe/pipeline/pipeline_builder.hpp"

#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace stagedpipe;

namespace
{

struct DemoContext : IBehaviorContext
{
    static const char* shape_name()
    {
        return "DemoContext";
    }
};

class MyBehavior1 : public Behavior<DemoContext>
{
public:
    static const char* behavior_name()
    {
        return "MyBehavior1";
    }

    void invoke(DemoContext&, const std::function<void()>& next, const CancellationToken&) override
    {
        std::cout << behavior_name() << "\n";
        next();
    }
};

class MyBehavior2 : public Behavior<DemoContext>
{
public:
    static const char* behavior_name()
    {
        return "MyBehavior2";
    }

    void invoke(DemoContext&, const std::function<void()>& next, const CancellationToken&) override
    {
        std::cout << behavior_name() << "\n";
        next();
    }
};

class CancelBehavior : public Behavior<DemoContext>
{
public:
    static const char* behavior_name()
    {
        return "CancelBehavior";
    }

    void invoke(DemoContext&, const std::function<void()>& next, const CancellationToken& token) override
    {
        std::cout << behavior_name() << "\n";
        token.throw_if_cancellation_requested();
        next();
    }
};

// ====== staged example ======

struct RequestContext : IBehaviorContext
{
    static const char* shape_name()
    {
        return "RequestContext";
    }

    std::string body;
};

struct ResponseContext : IBehaviorContext
{
    static const char* shape_name()
    {
        return "ResponseContext";
    }

    std::string request_body;
    int status{0};
};

class Trim : public Behavior<RequestContext>
{
public:
    void invoke(RequestContext& context, const std::function<void()>& next, const CancellationToken&) override
    {
        auto first = context.body.find_first_not_of(' ');
        auto last = context.body.find_last_not_of(' ');
        context.body = (first == std::string::npos) ? std::string{} : context.body.substr(first, last - first + 1);
        next();
    }
};

class Validate : public Behavior<RequestContext>
{
public:
    void invoke(RequestContext& context, const std::function<void()>& next, const CancellationToken&) override
    {
        if (context.body.empty())
        {
            std::cout << "  request rejected: empty body\n";
            return;
        }
        next();
    }
};

class ToResponse : public StageConnector<RequestContext, ResponseContext>
{
public:
    void invoke(RequestContext& context, const Next& next, const CancellationToken& token) override
    {
        ResponseContext response;
        response.request_body = context.body;
        response.status = 200;
        next(response, token);
    }
};

class Print : public PipelineTerminator<ResponseContext>
{
protected:
    void terminate(ResponseContext& context, const CancellationToken&) override
    {
        std::cout << "  " << context.status << " '" << context.request_body << "'\n";
    }
};

void run_chain_demo()
{
    DemoContext context;
    auto pipeline = ChainCompiler::compile_behaviors<DemoContext>({
        std::make_shared<MyBehavior1>(),
        std::make_shared<MyBehavior2>(),
        std::make_shared<CancelBehavior>(),
    });

    std::cout << "Execute 1\n";
    pipeline->execute(context, CancellationToken::none());

    for (int i = 2; i <= 3; ++i)
    {
        try
        {
            std::cout << "\nExecute " << i << " with cancellation\n";
            pipeline->execute(context, CancellationToken::cancelled());
        }
        catch (const OperationCancelled&)
        {
            std::cout << "Cancelled\n";
        }
    }

    std::cout << "\nExecute 4\n";
    pipeline->execute(context, CancellationToken::none());
}

void run_staged_demo()
{
    Settings settings;
    settings.set_default("Validation.Enabled", true);
    settings.lock();

    DefaultBuilder behavior_builder;
    PipelineBuilder builder(settings, behavior_builder);
    builder.register_step<Print>("Print", "Writes the response");
    builder.register_step<ToResponse>("ToResponse", "Turns the request into a response");
    builder.register_step<Validate>("Validate", "Rejects empty requests")
        ->set_enabled_when([](const IReadOnlySettings& s) { return s.get_or_default<bool>("Validation.Enabled"); });
    builder.register_step<Trim>("Trim", "Strips surrounding blanks")->insert_before("Validate");

    auto pipeline = builder.build<RequestContext>();
    std::cout << "\nStaged pipeline:";
    for (const auto& id : pipeline->step_ids())
    {
        std::cout << " " << id;
    }
    std::cout << "\n";

    for (const char* body : {"  hello  ", "   "})
    {
        RequestContext request;
        request.body = body;
        pipeline->execute(request);
    }
}

} // namespace

int main(int argc, char** argv)
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;
    if (argc > 1)
    {
        FLAGS_v = std::atoi(argv[1]);
    }

    try
    {
        std::cout << "\n\n====== stagedpipe ======\n" << std::flush;

        run_chain_demo();
        run_staged_demo();

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const PipelineConfigError& e)
    {
        LOG(ERROR) << "Pipeline configuration failed (" << to_string(e.code()) << "): " << e.what();
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
