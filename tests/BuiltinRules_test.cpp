#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "LineBuffer.hpp"
#include "RuleSet.hpp"
#include "BuiltinRules.hpp"
#include "RewriteEngine.hpp"

namespace
{

// A client module carrying the interceptor facility in every shape the preset handles
const std::string clientSource = R"rs(//! Client wrapper for ergonomic API access.

// Allow this lint at module level for interceptor helper methods
// that require many parameters for comprehensive context passing
#![allow(clippy::too_many_arguments)]

use crate::interceptor::{
    AfterResponseContext, BeforeRequestContext, ErrorContext, InterceptorChain,
};
use std::collections::HashMap;
use std::sync::Arc;
use tokio::sync::RwLock;

// Helper macro to generate interceptor helper methods for sub-clients
macro_rules! impl_interceptor_helpers {
    ($client_type:ty) => {
        impl<T: Default + Send + Sync> $client_type {
            async fn call_before_request(&self) -> Result<()> {
                Ok(())
            }
        }
    };
}

impl_interceptor_helpers!(AudioClient<'_, T>);
impl_interceptor_helpers!(
    EmbeddingsClient<'_, T>
);

pub struct Client<T = ()> {
    config: Arc<Config>,
    interceptors: Arc<InterceptorChain<T>>,
}

// Custom Debug implementation since InterceptorChain doesn't implement Debug
impl<T> std::fmt::Debug for Client<T> {
    fn fmt(&self, f: &mut std::fmt::Formatter<'_>) -> std::fmt::Result {
        f.debug_struct("Client")
            .field("config", &self.config)
            .field("interceptors", &"<InterceptorChain>")
            .finish()
    }
}

impl<T: Default + Send + Sync> Client<T> {
    pub fn new(config: Config) -> Self {
        Self {
            config: Arc::new(config),
            interceptors: Arc::new(InterceptorChain::new()),
        }
    }

    /// Add an interceptor to the client.
    ///
    /// ```rust,ignore
    /// let client = Client::new(config).with_interceptor(Box::new(Logger { level: 1 }));
    /// ```
    pub fn with_interceptor(mut self, interceptor: Box<dyn Interceptor<T>>) -> Self {
        if let Some(chain) = Arc::get_mut(&mut self.interceptors) {
            chain.add(interceptor);
        }
        self
    }

    /// Get a reference to the interceptor chain.
    pub(crate) fn interceptors(&self) -> &InterceptorChain<T> {
        &self.interceptors
    }
}

// Interceptor helper methods
impl<T: Default + Send + Sync> Client<T> {
    /// Helper to call `before_request` hooks
    async fn call_before_request(&self, operation: &str) -> Result<()> {
        if !self.interceptors.is_empty() {
            return Ok(());
        }
        Ok(())
    }
}

// Chat API methods
impl<T: Default + Send + Sync> Client<T> {
    /// Execute a chat completion request.
    pub async fn execute_chat(&self, request: Request) -> Result<Response> {
        let mut state = T::default();
        let mut metadata = HashMap::new();

        // Call before_request hook
        self.call_before_request(operation, &model, &request_json, &mut state)
            .await?;

        let response = match chat_api::create(&self.config, &metadata).await {
            Ok(resp) => resp,
            Err(e) => {
                let error = self
                    .handle_api_error(e, operation, &model, &request_json, &state)
                    .await;
                return Err(error);
            }
        };

        // Call after_response hook
        self.call_after_response(
            &response,
            operation,
            &state,
        )
        .await;

        Ok(response)
    }

    /// Execute an embeddings request.
    pub async fn execute_embeddings(&self, request: Request) -> Result<Response> {
        match embeddings_api::create(&self.config, &mut metadata).await {
            Ok(resp) => Ok(resp),
            Err(e) => Err(self.handle_api_error(e, operation, &model)),
        }
    }
}
)rs";

const std::string expectedSource = R"rs(//! Client wrapper for ergonomic API access.

use std::collections::HashMap;
use std::sync::Arc;



pub struct Client<T = ()> {
    config: Arc<Config>,
}

// Custom Debug implementation
impl<T> std::fmt::Debug for Client<T> {
    fn fmt(&self, f: &mut std::fmt::Formatter<'_>) -> std::fmt::Result {
        f.debug_struct("Client")
            .field("config", &self.config)
            .finish()
    }
}

impl<T: Default + Send + Sync> Client<T> {
    pub fn new(config: Config) -> Self {
        Self {
            config: Arc::new(config),
        }
    }


}


// Chat API methods
impl<T: Default + Send + Sync> Client<T> {
    /// Execute a chat completion request.
    pub async fn execute_chat(&self, request: Request) -> Result<Response> {
        let mut state = T::default();


        let response = match chat_api::create(&self.config).await {
            Ok(resp) => resp,
            Err(e) => {
                let error = map_api_error(e);
                return Err(error);
            }
        };


        Ok(response)
    }

    /// Execute an embeddings request.
    pub async fn execute_embeddings(&self, request: Request) -> Result<Response> {
        match embeddings_api::create(&self.config).await {
            Ok(resp) => Ok(resp),
            Err(e) => Err(map_api_error(e)),
        }
    }
}
)rs";

} // namespace

int main(int argc, char **argv)
{
    using namespace Excise;

    spdlog::set_level(spdlog::level::debug);

    int failures = 0;
    auto expect = [&failures](bool ok, const std::string & what)
    {
        if (!ok)
        {
            std::cout << "FAILED: " << what << std::endl;
            ++failures;
        }
    };

    // Every preset builds and validates
    for (const std::string & name : BuiltinRules::presetNames())
    {
        RuleSet ruleSet = BuiltinRules::get(name);
        expect(!ruleSet.empty(), "preset " + name + " has rules");
    }
    expect(BuiltinRules::presetNames().size() == 2, "two presets");

    bool threw = false;
    try
    {
        BuiltinRules::get("no-such-preset");
    }
    catch (const ConfigError & e)
    {
        threw = true;
        std::cout << "Caught as expected: " << e.what() << std::endl;
    }
    expect(threw, "unknown preset raises ConfigError");

    RuleSet ruleSet = BuiltinRules::get(BuiltinRules::DefaultPreset);
    LineBuffer buffer(clientSource);

    // No two rules compete for a line of the representative source
    std::vector<RuleSet::Ambiguity> ambiguities = ruleSet.findAmbiguities(buffer);
    for (const RuleSet::Ambiguity & ambiguity : ambiguities)
    {
        std::cout << "Ambiguous line " << ambiguity.index + 1 << std::endl;
    }
    expect(ambiguities.empty(), "preset rules are unambiguous on the client source");

    RewriteEngine engine(ruleSet, buffer);
    PatchResult result = engine.run();

    if (result.text() != expectedSource)
    {
        std::cout << "Expected: \n" << expectedSource << std::endl;
        std::cout << "Got: \n" << result.text() << std::endl;
    }
    expect(result.text() == expectedSource, "interceptor facility removed");

    std::vector<std::string> expectedIds
    {
        "lint-allow-comment",
        "interceptor-import",
        "rwlock-import",
        "helper-macro",
        "helper-macro-invocation",
        "helper-macro-invocation",
        "interceptors-field",
        "debug-impl-comment",
        "debug-interceptors-field",
        "interceptors-field",
        "with-interceptor-method",
        "interceptors-accessor",
        "interceptor-helper-impl",
        "metadata-declaration",
        "hook-comment",
        "before-request-call",
        "metadata-argument",
        "handle-api-error-chain",
        "hook-comment",
        "after-response-call",
        "metadata-argument",
        "handle-api-error-call"
    };
    expect(result.appliedRuleIds() == expectedIds, "rules fired in source order");

    // Spans are disjoint and increasing
    for (std::size_t i = 1; i < result.applied.size(); ++i)
    {
        expect(result.applied[i].startIndex > result.applied[i - 1].endIndex, "spans do not overlap");
    }

    // Patching the patched source changes nothing
    LineBuffer patched(result.text());
    RewriteEngine again(ruleSet, patched);
    PatchResult second = again.run();
    expect(!second.changed(), "preset is idempotent");
    expect(ruleSet.findAmbiguities(patched).empty(), "patched source has no contested lines");

    // The call-site preset touches only call sites
    {
        RuleSet calls = BuiltinRules::get("interceptor-calls");
        RewriteEngine callEngine(calls, buffer);
        PatchResult callResult = callEngine.run();
        for (const AppliedRewrite & record : callResult.applied)
        {
            expect
            (
                record.ruleId != "helper-macro" && record.ruleId != "interceptor-import",
                "call-site preset leaves declarations alone"
            );
        }
        expect(callResult.text().find("self.call_before_request(operation") == std::string::npos, "call-site preset removes before_request calls");
        expect(callResult.text().find("use crate::interceptor::{") != std::string::npos, "call-site preset keeps imports");
    }

    // Very long lines are matched without exhausting the stack
    {
        std::string filler(100000, 'a');
        std::string longSource =
            filler + "\n" +
            "        Err(e) => Err(self.handle_api_error(e, operation, &model))," + filler + "\n" +
            "        create(&self.config, &mut metadata)" + filler + "\n" +
            "    interceptors: Arc<InterceptorChain<T>>," + filler + "\n";
        LineBuffer longBuffer(longSource);
        expect(ruleSet.findAmbiguities(longBuffer).empty(), "long lines are not contested");
        RewriteEngine longEngine(ruleSet, longBuffer);
        PatchResult longResult = longEngine.run();
        std::vector<std::string> longIds{"handle-api-error-call", "metadata-argument", "interceptors-field"};
        expect(longResult.appliedRuleIds() == longIds, "rules fire on long lines");
        std::string expectedLong =
            filler + "\n" +
            "        Err(e) => Err(map_api_error(e))," + filler + "\n" +
            "        create(&self.config)" + filler + "\n";
        expect(longResult.text() == expectedLong, "long lines rewritten in place");
    }

    if (failures == 0)
    {
        std::cout << "Test passed!" << std::endl;
        return 0;
    }
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
}
