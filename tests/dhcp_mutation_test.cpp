#include "dhcpwarden/api.h"
#include "dhcpwarden/mutator.h"
#include "fake_http_client.h"

#include <cassert>
#include <nlohmann/json.hpp>
#include <string>

using namespace dhcpwarden;

static std::string header_value(const HttpRequest &req, const std::string &name) {
    for (const auto &h : req.headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

int main() {
    ApiContract contract;
    NodeSession session(contract, 10000);
    ConfigMutator mutator(contract, session, 15000);

    // Unreachable node: nothing is sent at all
    {
        FakeHttpClient *fake = nullptr;
        NodeContext node = make_fake_node("Primary", 0, fake);
        node.state.reachable = false;
        auto res = mutator.apply(node, true);
        assert(res.outcome == MutationOutcome::SKIPPED_UNREACHABLE);
        assert(fake->requests.empty());
    }

    // Login on demand, then a targeted PATCH carrying both tokens
    {
        FakeHttpClient *fake = nullptr;
        NodeContext node = make_fake_node("Primary", 0, fake);
        node.state.reachable = true;
        fake->respond("POST", AUTH_TARGET, 200, login_ok_body("s-1", "c-1"));
        fake->respond("PATCH", DHCP_TARGET, 200, R"({"success":true,"took":0.01})");

        auto res = mutator.apply(node, true);
        assert(res.outcome == MutationOutcome::APPLIED);
        assert(fake->requests.size() == 2);
        const HttpRequest &patch = fake->requests[1];
        assert(patch.method == "PATCH");
        assert(patch.timeout_ms == 15000);
        assert(header_value(patch, "sid") == "s-1");
        assert(header_value(patch, "X-CSRF-Token") == "c-1");
        auto body = nlohmann::json::parse(patch.body);
        assert(body == nlohmann::json::parse(R"({"config":{"dhcp":{"active":true}}})"));

        // Same desired state again: same outcome, session reused
        res = mutator.apply(node, true);
        assert(res.outcome == MutationOutcome::APPLIED);
        assert(fake->count("POST", AUTH_TARGET) == 1);
        assert(fake->count("PATCH", DHCP_TARGET) == 2);
    }

    // Disable request body
    {
        FakeHttpClient *fake = nullptr;
        NodeContext node = make_fake_node("Secondary", 1, fake);
        node.state.reachable = true;
        fake->respond("POST", AUTH_TARGET, 200, login_ok_body());
        fake->respond("PATCH", DHCP_TARGET, 200, R"({"success":true})");
        assert(mutator.apply(node, false).outcome == MutationOutcome::APPLIED);
        auto body = nlohmann::json::parse(fake->requests.back().body);
        assert(body["config"]["dhcp"]["active"] == false);
        assert(body["config"].size() == 1 && body["config"]["dhcp"].size() == 1);
    }

    // Login failure aborts the node without a PATCH
    {
        FakeHttpClient *fake = nullptr;
        NodeContext node = make_fake_node("Primary", 0, fake);
        node.state.reachable = true;
        fake->respond("POST", AUTH_TARGET, 200, R"({"session":{"sid":"only-sid"}})");
        auto res = mutator.apply(node, true);
        assert(res.outcome == MutationOutcome::AUTH_FAILED);
        assert(fake->count("PATCH", DHCP_TARGET) == 0);
        assert(!node.state.session);
    }

    // 401 and 403 both drop the session
    for (int status : {401, 403}) {
        FakeHttpClient *fake = nullptr;
        NodeContext node = make_fake_node("Primary", 0, fake);
        node.state.reachable = true;
        node.state.session = Session{"stale", "stale-csrf"};
        fake->respond("PATCH", DHCP_TARGET, status, R"({"error":{"key":"unauthorized"}})");
        auto res = mutator.apply(node, true);
        assert(res.outcome == MutationOutcome::SESSION_REJECTED);
        assert(!node.state.session);
        assert(fake->cookie_clears == 1);
        assert(fake->count("POST", AUTH_TARGET) == 0);
    }

    // 403 is not an auth failure when the contract says only 401 is
    {
        ApiContract strict;
        strict.auth_failure_statuses = {401};
        NodeSession strict_session(strict, 10000);
        ConfigMutator strict_mutator(strict, strict_session, 15000);
        FakeHttpClient *fake = nullptr;
        NodeContext node = make_fake_node("Primary", 0, fake);
        node.state.reachable = true;
        node.state.session = Session{"sid", "csrf"};
        fake->respond("PATCH", DHCP_TARGET, 403, "");
        assert(strict_mutator.apply(node, true).outcome == MutationOutcome::FAILED);
        assert(node.state.session);
    }

    // Server error, transport error and garbage keep the session
    {
        FakeHttpClient *fake = nullptr;
        NodeContext node = make_fake_node("Primary", 0, fake);
        node.state.reachable = true;
        node.state.session = Session{"sid", "csrf"};

        fake->respond("PATCH", DHCP_TARGET, 500, "");
        auto res = mutator.apply(node, true);
        assert(res.outcome == MutationOutcome::FAILED);
        assert(res.detail.find("500") != std::string::npos);

        fake->reset("PATCH", DHCP_TARGET);
        fake->fail("PATCH", DHCP_TARGET, "timed out");
        assert(mutator.apply(node, true).outcome == MutationOutcome::FAILED);

        fake->reset("PATCH", DHCP_TARGET);
        fake->respond("PATCH", DHCP_TARGET, 200, "not json");
        assert(mutator.apply(node, true).outcome == MutationOutcome::FAILED);

        assert(node.state.session && node.state.session->sid == "sid");
        assert(fake->cookie_clears == 0);
        assert(fake->count("POST", AUTH_TARGET) == 0);
    }

    // Accepted without a success flag is a soft warning
    {
        FakeHttpClient *fake = nullptr;
        NodeContext node = make_fake_node("Primary", 0, fake);
        node.state.reachable = true;
        node.state.session = Session{"sid", "csrf"};
        fake->respond("PATCH", DHCP_TARGET, 200, R"({"config":{"dhcp":{"active":true}}})");
        auto res = mutator.apply(node, true);
        assert(res.outcome == MutationOutcome::UNCONFIRMED);
        assert(node.state.session);
    }

    // Legacy generation: sid as cookie, status string reply
    {
        FakeHttpClient *fake = nullptr;
        NodeContext node = make_fake_node("Tertiary", 2, fake, ApiGeneration::LEGACY);
        node.state.reachable = true;
        node.state.session = Session{"legacy-sid", "legacy-csrf"};
        fake->respond("PATCH", DHCP_TARGET, 200, R"({"status":"dhcp_disabled"})");
        assert(mutator.apply(node, false).outcome == MutationOutcome::APPLIED);
        const HttpRequest &patch = fake->requests.back();
        assert(header_value(patch, "Cookie") == "sid=legacy-sid");
        assert(header_value(patch, "X-CSRF-Token") == "legacy-csrf");
        assert(header_value(patch, "sid").empty());
        assert(!patch.send_cookies);

        // Status disagreeing with the request is not a confirmation
        assert(mutator.apply(node, true).outcome == MutationOutcome::UNCONFIRMED);
    }

    // Restart flag is configurable
    {
        ApiContract no_restart;
        no_restart.restart_on_apply = false;
        Session s{"a", "b"};
        HttpRequest req = build_dhcp_request(no_restart, ApiGeneration::V6, s, true, 1000);
        assert(req.target == "/api/config");
    }

    // Health requests stay outside the cookie session
    {
        HttpRequest health = build_health_request(ApiContract{}, 1000);
        assert(!health.send_cookies);
    }

    // Outcome names used in logs
    assert(std::string(mutation_outcome_str(MutationOutcome::APPLIED)) == "applied");
    assert(std::string(mutation_outcome_str(MutationOutcome::SESSION_REJECTED)) == "session_rejected");
    assert(std::string(mutation_outcome_str(MutationOutcome::SKIPPED_UNREACHABLE)) == "skipped_unreachable");
    return 0;
}
