#include "confcache/provider/tests/test-providers.hh"

namespace confcache {

const TypeRef GreetingProvider::greetingType{"org.example.Greeting"};

const TypeRef EchoValueSource::type{"org.example.EchoValueSource"};
const TypeRef EchoValueSource::parametersType{"org.example.EchoValueSource.Parameters"};

const TypeRef TestBuildService::type{"org.example.TestBuildService"};

} // namespace confcache
