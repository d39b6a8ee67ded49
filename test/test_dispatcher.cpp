#include <cerrno>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "dispatcher.h"
#include "encoder.h"

using at::Cause;
using at::Command;
using at::Parameter;
using at::Response;
using at::Status;
using at::Type;

namespace {

/** Records the commands a handler receives. */
struct Recorder {
    std::vector<Command> commands;
    int result = 0;
    int cme_code = -1;
    const char *line = nullptr;
    const char *final_text = nullptr;
};

int record(const Command &cmd, Response &rsp, void *user)
{
    Recorder *recorder = static_cast<Recorder*>(user);
    recorder->commands.push_back(cmd);

    if (recorder->line != nullptr && rsp.add(recorder->line) != 0)
        return -EIO;

    if (recorder->final_text != nullptr && rsp.set_final(recorder->final_text) != 0)
        return -EIO;

    if (recorder->cme_code >= 0)
        rsp.set_cme_error(recorder->cme_code);

    return recorder->result;
}

int csq_read(const Command &, Response &rsp, void *)
{
    return rsp.add("+CSQ: 15,99");
}

int throws(const Command &, Response &rsp, void *)
{
    if (rsp.add("partial") != 0)
        return -EIO;

    throw std::runtime_error("device unplugged");
}

int throws_integer(const Command &, Response &, void *)
{
    throw 42;
}

int closes(const Command &, Response &rsp, void *)
{
    return rsp.complete();
}

struct Unsolicited {
    std::vector<std::string> lines;
};

void unsolicited_callback(const char *line, size_t size, void *user)
{
    static_cast<Unsolicited*>(user)->lines.emplace_back(line, size);
}

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        at::handler_t csq = {};
        csq.read = csq_read;
        ASSERT_EQ(registry.register_command("+CSQ", csq), 0);

        at::handler_t all = {};
        all.test = record;
        all.read = record;
        all.set = record;
        all.execute = record;
        all.user = &recorder;
        ASSERT_EQ(registry.register_command("+CPIN", all), 0);
        ASSERT_EQ(registry.register_command("+CGMR", all), 0);
        ASSERT_EQ(registry.register_command("E", all), 0);
        ASSERT_EQ(registry.register_command("V", all), 0);
        ASSERT_EQ(registry.register_command("D", all), 0);
        ASSERT_EQ(registry.register_command("S0", all), 0);
        ASSERT_EQ(registry.register_command("&F", all), 0);
    }

    /** Handle 'line' with 'dispatcher' and return the encoded output. */
    std::string run(at::Dispatcher &dispatcher, const std::string &line)
    {
        responses.clear();
        const int result = dispatcher.handle(line, responses);
        EXPECT_EQ(result, 0) << line;

        for (const Response &rsp : responses)
            EXPECT_TRUE(rsp.closed()) << line;

        return at::encode(responses, dispatcher.config());
    }

    std::string run(const std::string &line)
    {
        return run(dispatcher, line);
    }

    at::Registry registry;
    at::Dispatcher dispatcher{registry};
    Recorder recorder;
    std::vector<Response> responses;
};

TEST_F(DispatcherTest, ReadWithInformation)
{
    EXPECT_EQ(run("AT+CSQ?"), "\r\n+CSQ: 15,99\r\n\r\nOK\r\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status(), Status::ok);
}

TEST_F(DispatcherTest, CapabilityMismatch)
{
    EXPECT_EQ(run("AT+CSQ=1"), "\r\nERROR\r\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].cause(), Cause::capability_mismatch);

    run("AT+CSQ");
    EXPECT_EQ(responses[0].cause(), Cause::capability_mismatch);
}

TEST_F(DispatcherTest, UnknownCommand)
{
    EXPECT_EQ(run("AT+ZZZZ"), "\r\nERROR\r\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].cause(), Cause::not_found);

    // The channel is still usable
    EXPECT_EQ(run("AT+CSQ?"), "\r\n+CSQ: 15,99\r\n\r\nOK\r\n");
}

TEST_F(DispatcherTest, TypeDeterminism)
{
    run("AT+CPIN=?");
    run("AT+CPIN?");
    run("AT+CPIN=1,2");
    run("AT+CPIN");

    ASSERT_EQ(recorder.commands.size(), 4u);
    EXPECT_EQ(recorder.commands[0].type(), Type::test);
    EXPECT_TRUE(recorder.commands[0].parameters().empty());
    EXPECT_EQ(recorder.commands[1].type(), Type::read);
    EXPECT_EQ(recorder.commands[2].type(), Type::set);
    EXPECT_EQ(recorder.commands[2].parameters(),
            std::vector<Parameter>({ Parameter::integer(1), Parameter::integer(2) }));
    EXPECT_EQ(recorder.commands[3].type(), Type::execute);
    EXPECT_TRUE(recorder.commands[3].parameters().empty());
}

TEST_F(DispatcherTest, QuotedParameters)
{
    EXPECT_EQ(run("AT+CPIN=\"1234\",,\"abc\"\"def\""), "\r\nOK\r\n");

    ASSERT_EQ(recorder.commands.size(), 1u);
    const Command &cmd = recorder.commands[0];
    EXPECT_EQ(cmd.name(), "+CPIN");
    EXPECT_EQ(cmd.raw(), "AT+CPIN=\"1234\",,\"abc\"\"def\"");
    ASSERT_EQ(cmd.parameters().size(), 3u);
    EXPECT_EQ(cmd.parameter(0), Parameter::string("1234"));
    EXPECT_TRUE(cmd.parameter(1).is_omitted());
    EXPECT_EQ(cmd.parameter(2), Parameter::string("abc\"def"));
    EXPECT_TRUE(cmd.parameter(3).is_omitted());
}

TEST_F(DispatcherTest, SameLineSameCommand)
{
    run("AT+CPIN=\"1234\",7");
    run("AT+CPIN=\"1234\",7");

    ASSERT_EQ(recorder.commands.size(), 2u);
    EXPECT_EQ(recorder.commands[0], recorder.commands[1]);
}

TEST_F(DispatcherTest, CaseInsensitive)
{
    EXPECT_EQ(run("at+csq?"), "\r\n+CSQ: 15,99\r\n\r\nOK\r\n");

    at::Config config;
    config.case_insensitive = false;
    at::Dispatcher sensitive(registry, config);

    EXPECT_EQ(run(sensitive, "at+csq?"), "\r\nERROR\r\n");
    EXPECT_EQ(responses[0].cause(), Cause::not_found);
    EXPECT_EQ(run(sensitive, "at+CSQ?"), "\r\n+CSQ: 15,99\r\n\r\nOK\r\n");
}

TEST_F(DispatcherTest, LowerCaseRegistration)
{
    at::handler_t handler = {};
    handler.read = record;
    handler.user = &recorder;
    ASSERT_EQ(registry.register_command("+cgsn", handler), 0);

    EXPECT_EQ(run("at+cgsn?"), "\r\nOK\r\n");
    EXPECT_EQ(run("AT+CGSN?"), "\r\nOK\r\n");
    EXPECT_EQ(recorder.commands.size(), 2u);
}

TEST_F(DispatcherTest, BareAt)
{
    EXPECT_EQ(run("AT"), "\r\nOK\r\n");
    EXPECT_EQ(run("  at  "), "\r\nOK\r\n");
    EXPECT_TRUE(recorder.commands.empty());
}

TEST_F(DispatcherTest, BlankLineIsIgnored)
{
    EXPECT_EQ(dispatcher.handle("", responses), -ENODATA);
    EXPECT_EQ(dispatcher.handle("   ", responses), -ENODATA);
    EXPECT_TRUE(responses.empty());
}

TEST_F(DispatcherTest, UnsolicitedLines)
{
    Unsolicited sink;
    dispatcher.set_unsolicited_callback(unsolicited_callback, &sink);

    EXPECT_EQ(dispatcher.handle("+CREG: 1", responses), -ENOMSG);
    EXPECT_EQ(dispatcher.handle("RING", responses), -ENOMSG);
    EXPECT_TRUE(responses.empty());

    ASSERT_EQ(sink.lines.size(), 2u);
    EXPECT_EQ(sink.lines[0], "+CREG: 1");
    EXPECT_EQ(sink.lines[1], "RING");
    EXPECT_TRUE(recorder.commands.empty());

    // Without a callback the line is still not dispatched
    dispatcher.set_unsolicited_callback(nullptr);
    EXPECT_EQ(dispatcher.handle("+CREG: 2", responses), -ENOMSG);
    EXPECT_EQ(sink.lines.size(), 2u);
}

TEST_F(DispatcherTest, InvalidTextIsFatal)
{
    EXPECT_EQ(dispatcher.handle(nullptr, 0, responses), -EINVAL);
    EXPECT_EQ(dispatcher.handle("AT+CSQ?\r", responses), -EINVAL);
    EXPECT_EQ(dispatcher.handle("AT\n+CSQ?", responses), -EINVAL);
    EXPECT_EQ(dispatcher.handle(std::string("AT\0+CSQ?", 8), responses), -EINVAL);
    EXPECT_TRUE(responses.empty());
}

TEST_F(DispatcherTest, ChainedCommandsAreIndependent)
{
    EXPECT_EQ(run("AT+CSQ?;+ZZZZ;+CPIN?"),
            "\r\n+CSQ: 15,99\r\n\r\nOK\r\n"
            "\r\nERROR\r\n"
            "\r\nOK\r\n");

    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[1].cause(), Cause::not_found);
    EXPECT_EQ(recorder.commands.size(), 1u);
}

TEST_F(DispatcherTest, MalformedCommandInChain)
{
    run("AT+CPIN?;*;+CPIN=?");

    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0].status(), Status::ok);
    EXPECT_EQ(responses[1].cause(), Cause::malformed_command);
    EXPECT_EQ(responses[2].status(), Status::ok);
    EXPECT_EQ(recorder.commands.size(), 2u);
}

TEST_F(DispatcherTest, UnterminatedQuoteHidingRestOfLine)
{
    run("AT+CPIN?;+CPIN=\"12;+CSQ?");

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0].status(), Status::ok);
    EXPECT_EQ(responses[1].cause(), Cause::malformed_command);
    EXPECT_EQ(recorder.commands.size(), 1u);
}

TEST_F(DispatcherTest, UnterminatedQuote)
{
    EXPECT_EQ(run("AT+CPIN=\"1234"), "\r\nERROR\r\n");
    EXPECT_EQ(responses[0].cause(), Cause::unterminated_quote);
    EXPECT_TRUE(recorder.commands.empty());
}

TEST_F(DispatcherTest, MalformedLine)
{
    EXPECT_EQ(run("AT="), "\r\nERROR\r\n");
    EXPECT_EQ(responses[0].cause(), Cause::malformed_command);
}

TEST_F(DispatcherTest, UnexpectedParameters)
{
    run("AT+CPIN?1");
    EXPECT_EQ(responses[0].cause(), Cause::unexpected_parameters);

    run("AT+CPIN=?1");
    EXPECT_EQ(responses[0].cause(), Cause::unexpected_parameters);

    run("AT+CGMR 1");
    EXPECT_EQ(responses[0].cause(), Cause::unexpected_parameters);

    EXPECT_TRUE(recorder.commands.empty());
}

TEST_F(DispatcherTest, ExecuteParametersDialect)
{
    dispatcher.config().execute_parameters = true;

    EXPECT_EQ(run("AT+CGMR 1,\"x\""), "\r\nOK\r\n");
    ASSERT_EQ(recorder.commands.size(), 1u);
    EXPECT_EQ(recorder.commands[0].type(), Type::execute);
    EXPECT_EQ(recorder.commands[0].parameters(),
            std::vector<Parameter>({ Parameter::integer(1), Parameter::string("x") }));
}

TEST_F(DispatcherTest, EmptySetDialect)
{
    EXPECT_EQ(run("AT+CPIN="), "\r\nOK\r\n");
    ASSERT_EQ(recorder.commands.size(), 1u);
    EXPECT_EQ(recorder.commands[0].parameters(),
            std::vector<Parameter>({ Parameter::omitted() }));

    at::Config config;
    config.strict_empty_set = true;
    at::Dispatcher strict(registry, config);

    EXPECT_EQ(run(strict, "AT+CPIN="), "\r\nERROR\r\n");
    EXPECT_EQ(responses[0].cause(), Cause::missing_parameters);
    EXPECT_EQ(recorder.commands.size(), 1u);

    EXPECT_EQ(run(strict, "AT+CPIN=,"), "\r\nOK\r\n");
    EXPECT_EQ(recorder.commands.size(), 2u);
}

TEST_F(DispatcherTest, HandlerFailure)
{
    recorder.line = "+CPIN: READY";
    recorder.result = -1;

    EXPECT_EQ(run("AT+CPIN?"), "\r\nERROR\r\n");
    EXPECT_EQ(responses[0].cause(), Cause::handler_failure);
}

TEST_F(DispatcherTest, ExtendedErrors)
{
    recorder.result = -1;
    recorder.cme_code = 10;

    EXPECT_EQ(run("AT+CPIN?"), "\r\nERROR\r\n");

    dispatcher.config().extended_errors = true;
    EXPECT_EQ(run("AT+CPIN?"), "\r\n+CME ERROR: 10\r\n");
    EXPECT_EQ(responses[0].status(), Status::cme_error);
    EXPECT_EQ(responses[0].cme_code(), 10);

    // Failures without a code stay plain
    recorder.cme_code = -1;
    EXPECT_EQ(run("AT+CPIN?"), "\r\nERROR\r\n");

    // Parse failures never use CME codes
    EXPECT_EQ(run("AT+ZZZZ"), "\r\nERROR\r\n");
}

TEST_F(DispatcherTest, HandlerThrows)
{
    at::handler_t handler = {};
    handler.execute = throws;
    ASSERT_EQ(registry.register_command("+BOOM", handler), 0);

    EXPECT_EQ(run("AT+BOOM"), "\r\nERROR\r\n");
    EXPECT_EQ(responses[0].cause(), Cause::handler_failure);
    EXPECT_TRUE(responses[0].lines().empty());
}

TEST_F(DispatcherTest, HandlerThrowsNonStandardType)
{
    at::handler_t handler = {};
    handler.execute = throws_integer;
    ASSERT_EQ(registry.register_command("+BOOM", handler), 0);

    std::vector<Response> out;
    EXPECT_NO_THROW(EXPECT_EQ(dispatcher.handle("AT+BOOM;+CSQ?", out), 0));

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].status(), Status::error);
    EXPECT_EQ(out[0].cause(), Cause::handler_failure);
    EXPECT_EQ(out[1].status(), Status::ok);
}

TEST_F(DispatcherTest, HandlerClosingResponse)
{
    at::handler_t handler = {};
    handler.execute = closes;
    ASSERT_EQ(registry.register_command("+SHUT", handler), 0);

    EXPECT_EQ(run("AT+SHUT"), "\r\nOK\r\n");
    ASSERT_EQ(responses.size(), 1u);
}

TEST_F(DispatcherTest, CustomFinalResult)
{
    recorder.final_text = "CONNECT";
    EXPECT_EQ(run("AT+CPIN"), "\r\nCONNECT\r\n");
    EXPECT_EQ(responses[0].status(), Status::custom);
}

TEST_F(DispatcherTest, BasicCommands)
{
    EXPECT_EQ(run("ATE0V1&F"), "\r\nOK\r\n\r\nOK\r\n\r\nOK\r\n");

    ASSERT_EQ(recorder.commands.size(), 3u);
    EXPECT_EQ(recorder.commands[0].name(), "E");
    EXPECT_EQ(recorder.commands[0].type(), Type::execute);
    EXPECT_EQ(recorder.commands[0].parameters(),
            std::vector<Parameter>({ Parameter::integer(0) }));
    EXPECT_EQ(recorder.commands[1].name(), "V");
    EXPECT_EQ(recorder.commands[2].name(), "&F");
    EXPECT_TRUE(recorder.commands[2].parameters().empty());
    EXPECT_TRUE(recorder.commands[2].is_basic());
}

TEST_F(DispatcherTest, SParameters)
{
    run("ATS0=2");
    run("ats0?");

    ASSERT_EQ(recorder.commands.size(), 2u);
    EXPECT_EQ(recorder.commands[0].name(), "S0");
    EXPECT_EQ(recorder.commands[0].type(), Type::set);
    EXPECT_EQ(recorder.commands[0].parameters(),
            std::vector<Parameter>({ Parameter::integer(2) }));
    EXPECT_EQ(recorder.commands[1].type(), Type::read);
}

TEST_F(DispatcherTest, MalformedBasicValue)
{
    EXPECT_EQ(run("ATS0=abc"), "\r\nERROR\r\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].cause(), Cause::malformed_command);
    EXPECT_TRUE(recorder.commands.empty());
}

TEST_F(DispatcherTest, Dial)
{
    recorder.final_text = "NO CARRIER";
    EXPECT_EQ(run("ATDT5551234;"), "\r\nNO CARRIER\r\n");

    ASSERT_EQ(recorder.commands.size(), 1u);
    EXPECT_EQ(recorder.commands[0].name(), "D");
    EXPECT_EQ(recorder.commands[0].parameters(),
            std::vector<Parameter>({ Parameter::token("T5551234;") }));
}

TEST_F(DispatcherTest, RepeatWithoutHistory)
{
    EXPECT_EQ(run("A/"), "\r\nERROR\r\n");
    EXPECT_EQ(responses[0].cause(), Cause::not_found);
}

TEST_F(DispatcherTest, RepeatLastLine)
{
    run("AT+CPIN=1");
    EXPECT_EQ(dispatcher.last_line(), "AT+CPIN=1");

    // Failed lines are not remembered
    run("AT+ZZZZ");
    run("AT+CPIN=\"x");
    EXPECT_EQ(dispatcher.last_line(), "AT+CPIN=1");

    EXPECT_EQ(run("A/"), "\r\nOK\r\n");
    EXPECT_EQ(run("a/"), "\r\nOK\r\n");

    ASSERT_EQ(recorder.commands.size(), 3u);
    EXPECT_EQ(recorder.commands[2], recorder.commands[0]);

    dispatcher.clear_history();
    EXPECT_EQ(run("A/"), "\r\nERROR\r\n");
}

TEST_F(DispatcherTest, NumericResultCodes)
{
    dispatcher.config().verbose = false;
    EXPECT_EQ(run("AT+CSQ?"), "+CSQ: 15,99\r\n0\r");
    EXPECT_EQ(run("AT+ZZZZ"), "4\r");
}

TEST_F(DispatcherTest, IndependentChannels)
{
    at::Config config;
    config.extended_errors = true;
    at::Dispatcher other(registry, config);

    recorder.result = -1;
    recorder.cme_code = 3;

    EXPECT_EQ(run(dispatcher, "AT+CPIN?"), "\r\nERROR\r\n");
    EXPECT_EQ(run(other, "AT+CPIN?"), "\r\n+CME ERROR: 3\r\n");

    run(other, "AT+CSQ?");
    EXPECT_EQ(other.last_line(), "AT+CSQ?");
    EXPECT_EQ(dispatcher.last_line(), "");
}

TEST_F(DispatcherTest, EveryCommandGetsOneStatus)
{
    const char *lines[] = {
        "AT", "AT=", "AT+", "AT;;", "AT+CSQ?;", "AT+CSQ=?;+CSQ",
        "AT\"", "AT+CPIN=\"a;b\"", "AT+CPIN=\"", "ATE0V1Q", "AT&", "AT\\",
        "AT+CSQ?;;;+CSQ?", "ATS", "ATS=?", "AT#X", "AT%", "ATD", "AT+CPIN=1,\"",
    };

    for (const char *line : lines) {
        responses.clear();
        ASSERT_EQ(dispatcher.handle(line, responses), 0) << line;
        ASSERT_FALSE(responses.empty()) << line;

        for (const Response &rsp : responses) {
            EXPECT_TRUE(rsp.closed()) << line;
            EXPECT_NE(rsp.status(), Status::pending) << line;
        }
    }
}
