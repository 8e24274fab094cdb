#pragma once

#include "action_base.hpp"

namespace fsagent::actions {

/**
 * Builds a new version of a file from an existing one and a recipe of
 * ordered ops, so the peer only sends the changed regions:
 *
 *   {"copy":   {"off": <offset>, "len": <length>}}   bytes of the source
 *   {"insert": {"data": <base64>}}                   literal bytes
 *
 * The result replaces `dst` (default `src`) atomically and keeps the
 * destination's permission bits.
 */
class PatchAction final : public ActionHandler {
public:
	const char* name() const override { return "patch"; }
	void handle(ActionContext& ctx) override;
};

}
