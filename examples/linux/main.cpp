#include <errno.h>
#include <stdio.h>
#include <unistd.h>

#include "channel.h"
#include "dispatcher.h"
#include "registry.h"
#include "version.h"

/** Value stored by AT+CSCS. */
static char charset[16] = "IRA";

/** Read from STDIN. */
static int ctx_read(void *data, size_t size)
{
    return read(STDIN_FILENO, data, size);
}

/** Write to STDOUT. */
static int ctx_write(const void *data, size_t size)
{
    return write(STDOUT_FILENO, data, size);
}

/** Called with lines that are not AT commands. */
static void unsolicited_callback(const char *line, size_t size, void *user)
{
    (void)user;
    fprintf(stderr, "unsolicited: %.*s\n", static_cast<int>(size), line);
}

/** AT+CSQ - signal quality. */
static int csq_read(const at::Command &cmd, at::Response &rsp, void *user)
{
    (void)cmd;
    (void)user;
    return rsp.add("+CSQ: 15,99");
}

static int csq_test(const at::Command &cmd, at::Response &rsp, void *user)
{
    (void)cmd;
    (void)user;
    return rsp.add("+CSQ: (0-31,99),(0-7,99)");
}

/** AT+CGMR - firmware revision. */
static int cgmr_execute(const at::Command &cmd, at::Response &rsp, void *user)
{
    (void)cmd;
    (void)user;
    return rsp.add(at::version_string());
}

/** AT+CSCS - character set. */
static int cscs_read(const at::Command &cmd, at::Response &rsp, void *user)
{
    (void)cmd;
    (void)user;
    return rsp.addf("+CSCS: \"%s\"", charset);
}

static int cscs_set(const at::Command &cmd, at::Response &rsp, void *user)
{
    (void)user;
    const at::Parameter &param = cmd.parameter(0);
    if (!param.is_string() || param.text().size() >= sizeof(charset)) {
        rsp.set_cme_error(50);  // Incorrect parameters
        return -EINVAL;
    }

    snprintf(charset, sizeof(charset), "%s", param.text().c_str());
    return 0;
}

/** AT+CMEE - extended error reporting. */
static int cmee_set(const at::Command &cmd, at::Response &rsp, void *user)
{
    at::Dispatcher *dispatcher = static_cast<at::Dispatcher*>(user);
    const at::Parameter &mode = cmd.parameter(0);

    if (mode.is_omitted()) {
        dispatcher->config().extended_errors = false;
        return 0;
    }

    if (!mode.is_integer() || mode.value() < 0 || mode.value() > 1) {
        rsp.set_cme_error(50);
        return -EINVAL;
    }

    dispatcher->config().extended_errors = (mode.value() == 1);
    return 0;
}

static int cmee_read(const at::Command &cmd, at::Response &rsp, void *user)
{
    (void)cmd;
    at::Dispatcher *dispatcher = static_cast<at::Dispatcher*>(user);
    return rsp.addf("+CMEE: %d", dispatcher->config().extended_errors ? 1 : 0);
}

/** ATV - result code format. */
static int v_execute(const at::Command &cmd, at::Response &rsp, void *user)
{
    (void)rsp;
    at::Dispatcher *dispatcher = static_cast<at::Dispatcher*>(user);
    const at::Parameter &mode = cmd.parameter(0);

    if (mode.is_omitted() || (mode.is_integer() && mode.value() == 0))
        dispatcher->config().verbose = false;
    else if (mode.is_integer() && mode.value() == 1)
        dispatcher->config().verbose = true;
    else
        return -EINVAL;

    return 0;
}

/** ATD - dial. */
static int d_execute(const at::Command &cmd, at::Response &rsp, void *user)
{
    (void)user;
    if (cmd.parameters().empty())
        return -EINVAL;

    fprintf(stderr, "dialing %s\n", cmd.parameter(0).text().c_str());
    return rsp.set_final("NO CARRIER");
}

int main()
{
    at::context_t ctx;
    ctx.read = ctx_read;
    ctx.write = ctx_write;

    at::Registry registry;
    at::Dispatcher dispatcher(registry);

    // Register handlers
    at::handler_t csq = {};
    csq.read = csq_read;
    csq.test = csq_test;

    at::handler_t cgmr = {};
    cgmr.execute = cgmr_execute;

    at::handler_t cscs = {};
    cscs.read = cscs_read;
    cscs.set = cscs_set;

    at::handler_t cmee = {};
    cmee.read = cmee_read;
    cmee.set = cmee_set;
    cmee.user = &dispatcher;

    at::handler_t v = {};
    v.execute = v_execute;
    v.user = &dispatcher;

    at::handler_t d = {};
    d.execute = d_execute;

    if (registry.register_command("+CSQ", csq) != 0
            || registry.register_command("+CGMR", cgmr) != 0
            || registry.register_command("+CSCS", cscs) != 0
            || registry.register_command("+CMEE", cmee) != 0
            || registry.register_command("V", v) != 0
            || registry.register_command("D", d) != 0) {
        fprintf(stderr, "failed to register handlers\n");
        return 1;
    }

    dispatcher.set_unsolicited_callback(unsolicited_callback);

    // Initialize the channel
    at::Channel channel(ctx, dispatcher);

    while(1)
    {
        int result = channel.process();
        if (result < 0)
            fprintf(stderr, "channel error %d\n", result);
    }

    return 0;
}

#if (NOVAAT_DEBUG > 0)
/** DEBUG print function
 *
 * Only required when compiled with -DNOVAAT_DEBUG flag
 */
void at_debug(int level, const char *str)
{
    fprintf(stderr, "|%d| %s", level, str);
}
#endif
