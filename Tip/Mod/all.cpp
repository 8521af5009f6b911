#include"Gateway/Blitzi.hpp"
#include"Http/Client.hpp"
#include"Lnurl/Resolver.hpp"
#include"Tip/Config.hpp"
#include"Tip/Mod/CreationFlow.hpp"
#include"Tip/Mod/FundingFlow.hpp"
#include"Tip/Mod/Logger.hpp"
#include"Tip/Mod/RefundJob.hpp"
#include"Tip/Mod/TaskRunner.hpp"
#include"Tip/Mod/Timers.hpp"
#include"Tip/Mod/VoucherInfo.hpp"
#include"Tip/Mod/Waiter.hpp"
#include"Tip/Mod/WithdrawalFlow.hpp"
#include"Tip/Mod/all.hpp"
#include"Tip/Refunder.hpp"
#include<vector>

namespace {

class All {
private:
	std::vector<std::shared_ptr<void>> modules;

public:
	template<typename M, typename... As>
	std::shared_ptr<M> install(As&&... as) {
		auto ptr = std::make_shared<M>(as...);
		modules.push_back(std::shared_ptr<void>(ptr));
		return ptr;
	}
};

}

namespace Tip { namespace Mod {

std::shared_ptr<void> all( std::ostream& cerr
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , Http::Router& router
			 , Tip::Store& store
			 , Tip::Config const& config
			 ) {
	auto all = std::make_shared<All>();

	/* Basic.  */
	auto waiter = all->install<Waiter>(bus);
	all->install<Logger>(bus, cerr, config.log_level);
	auto runner = all->install<TaskRunner>(bus, *waiter);
	all->install<Timers>(bus, *waiter, config.refund_interval);

	/* Outside world.  */
	auto client = all->install<Http::Client>(threadpool);
	auto gateway = all->install<Gateway::Blitzi>( *client
						    , *waiter
						    , config.gateway_url
						    , config.gateway_token
						    , config.poll_interval
						    );
	auto resolver = all->install<Lnurl::Resolver>(*client);
	auto refunder = all->install<Tip::Refunder>(bus, *resolver, *gateway);

	/* Voucher lifecycle.  */
	all->install<CreationFlow>( bus, router, store
				  , *gateway, *runner, config
				  );
	all->install<FundingFlow>( bus, router, store
				 , *gateway, *refunder, *runner, config
				 );
	all->install<WithdrawalFlow>(bus, router, store, *gateway, config);
	all->install<RefundJob>( bus, store, *refunder, *runner
			       , config.refund_interval
			       );
	all->install<VoucherInfo>(bus, router, store);

	return all;
}

}}
