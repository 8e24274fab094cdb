#include <gtest/gtest.h>

#include "action/action_registry.hpp"

#include <memory>
#include <stdexcept>

using namespace fsagent::actions;

namespace {

class NamedAction final : public ActionHandler {
public:
	explicit NamedAction(const char* name) : name_(name) {}

	const char* name() const override { return name_; }
	void handle(ActionContext&) override {}

private:
	const char* name_;
};

} // namespace

TEST(ActionRegistry, FindsRegisteredHandler) {
	ActionRegistry registry;
	registry.add(std::make_unique<NamedAction>("read"));
	registry.add(std::make_unique<NamedAction>("write"));

	EXPECT_EQ(registry.size(), 2u);
	ASSERT_NE(registry.find("read"), nullptr);
	EXPECT_STREQ(registry.find("read")->name(), "read");
	EXPECT_EQ(registry.find("unlink"), nullptr);
}

TEST(ActionRegistry, DuplicateNameIsRejected) {
	ActionRegistry registry;
	registry.add(std::make_unique<NamedAction>("stat"));

	EXPECT_THROW(registry.add(std::make_unique<NamedAction>("stat")), std::logic_error);
	EXPECT_EQ(registry.size(), 1u);
}
