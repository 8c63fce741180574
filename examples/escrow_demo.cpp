/**
 * Escrow Demo - a renovation contract end to end
 *
 * This demo shows how to:
 * 1. Register subjects and create a contract with obligations and milestones
 * 2. Fund the contract's secured balance account
 * 3. Satisfy obligations and release milestones (manual and automatic)
 * 4. Open a claim, settle it, and watch the contract leave dispute
 * 5. Journal every posting to disk and verify the account against it
 */

#include <surety.hpp>

#include <filesystem>
#include <iostream>

using namespace surety;
using namespace surety::commitment;

namespace {

    std::string amount(Money minor) {
        std::string cents = std::to_string(minor % 100);
        return std::to_string(minor / 100) + "." + (cents.size() == 1 ? "0" + cents : cents);
    }

    void printAccount(const ledger::SecuredBalanceAccount &acct) {
        std::cout << "   account " << acct.id << ": balance " << amount(acct.balance()) << ", held "
                  << amount(acct.held()) << ", released " << amount(acct.released())
                  << ", forfeited " << amount(acct.forfeited()) << "\n";
    }

    template <typename T> bool check(const dp::Result<T, dp::Error> &result, const std::string &what) {
        if (result.is_ok())
            return true;
        std::cerr << "   " << what << " failed: " << errorMessage(result.error()) << "\n";
        return false;
    }

} // namespace

int main() {
    std::cout << "=== Surety Escrow Demo ===\n\n";

    const std::string storage_path = "demo_surety_journal";
    if (std::filesystem::exists(storage_path)) {
        std::filesystem::remove_all(storage_path);
    }

    // ===========================================
    // 1. Storage and engine
    // ===========================================

    storage::FileStore store;
    if (!store.open(dp::String(storage_path.c_str())).is_ok() || !store.initializeCoreSchema().is_ok()) {
        std::cerr << "Failed to open journal at " << storage_path << "\n";
        return 1;
    }
    storage::Journal journal(store);

    const std::string tenant = "acme";
    subject::InMemorySubjectRegistry registry;
    subject::SubjectRef contractor("biz", "reno-co");
    subject::SubjectRef homeowner("user", "h-17");
    (void)registry.registerSubject(tenant, contractor);
    (void)registry.registerSubject(tenant, homeowner);

    EngineConfig config;
    config.log_level = LogLevel::Info;
    CommitmentEngine engine(registry, config);
    engine.attachJournal(&journal);

    // ===========================================
    // 2. Contract, obligations, milestones
    // ===========================================

    std::cout << "1. Creating contract...\n";
    ContractDraft draft;
    draft.tenant_id = tenant;
    draft.title = "Kitchen renovation";
    draft.anchor = contractor;
    draft.counterparty = homeowner;
    draft.committed_amount = 1000000; // 10,000.00
    auto contract = engine.createContract(draft);
    if (!check(contract, "createContract"))
        return 1;
    const std::string cid = contract.value().id;

    ObligationDraft demolition;
    demolition.title = "Demolition";
    demolition.obligor = contractor;
    ObligationDraft cabinets;
    cabinets.title = "Cabinets installed";
    cabinets.obligor = contractor;
    ObligationDraft payment;
    payment.title = "Progress payment";
    payment.type = ObligationKind::Payment;
    payment.obligor = homeowner;
    payment.required_amount = 200000;

    auto o1 = engine.addObligation(tenant, cid, demolition);
    auto o2 = engine.addObligation(tenant, cid, cabinets);
    auto o3 = engine.addObligation(tenant, cid, payment);
    if (!check(o1, "addObligation") || !check(o2, "addObligation") || !check(o3, "addObligation"))
        return 1;

    MilestoneDraft rough_in;
    rough_in.code = "ROUGH_IN";
    rough_in.title = "Rough-in complete";
    rough_in.release_amount = 400000;
    MilestoneDraft finish;
    finish.code = "FINISH";
    finish.title = "Finish work";
    finish.release_mode = ReleaseMode::Automatic;
    finish.release_amount = 500000;

    auto m1 = engine.addMilestone(tenant, cid, rough_in);
    auto m2 = engine.addMilestone(tenant, cid, finish);
    if (!check(m1, "addMilestone") || !check(m2, "addMilestone"))
        return 1;
    (void)engine.linkObligation(tenant, m1.value().id, o1.value().id);
    (void)engine.linkObligation(tenant, m1.value().id, o3.value().id);
    (void)engine.linkObligation(tenant, m2.value().id, o2.value().id);

    if (!check(engine.activateContract(tenant, cid), "activateContract"))
        return 1;
    std::cout << "   ✓ " << cid << " active, committed " << amount(draft.committed_amount) << "\n\n";

    // ===========================================
    // 3. Funding
    // ===========================================

    std::cout << "2. Funding escrow...\n";
    ledger::OpenAccountRequest account_request;
    account_request.tenant_id = tenant;
    account_request.contract_id = cid;
    account_request.title = "Kitchen escrow";
    account_request.owner = contractor;
    account_request.counterparty = homeowner;
    auto account = engine.openAccount(account_request);
    if (!check(account, "openAccount"))
        return 1;
    const std::string aid = account.value().id;

    FundingSource source;
    source.external_transaction_id = "wire-5531";
    source.source_subject = homeowner;
    source.idempotency_key = "wire-5531";
    if (!check(engine.fundAccount(tenant, aid, 1000000, source), "fundAccount"))
        return 1;
    printAccount(engine.ledger().account(tenant, aid).value());
    std::cout << "\n";

    // ===========================================
    // 4. Progress and releases
    // ===========================================

    std::cout << "3. Recording progress...\n";
    (void)engine.satisfyObligation(tenant, o1.value().id);
    (void)engine.recordSatisfaction(tenant, o3.value().id, 100000);
    std::cout << "   ROUGH_IN after partial payment: "
              << milestoneStatusToString(engine.milestone(tenant, m1.value().id).value().status) << "\n";
    (void)engine.recordSatisfaction(tenant, o3.value().id, 100000);
    std::cout << "   ROUGH_IN after full payment: "
              << milestoneStatusToString(engine.milestone(tenant, m1.value().id).value().status) << "\n";

    auto released = engine.releaseMilestone(tenant, m1.value().id, "user:site-manager");
    if (!check(released, "releaseMilestone"))
        return 1;
    std::cout << "   ✓ Released ROUGH_IN with " << released.value().allocations.size() << " allocations\n";
    printAccount(engine.ledger().account(tenant, aid).value());
    std::cout << "\n";

    // ===========================================
    // 5. A claim during finish work
    // ===========================================

    std::cout << "4. Homeowner opens a claim...\n";
    ClaimDraft claim_draft;
    claim_draft.type = claim::ClaimKind::QualityIssue;
    claim_draft.title = "Cabinet doors misaligned";
    claim_draft.raised_by = homeowner;
    claim_draft.against = contractor;
    claim_draft.disputed_milestone_id = m2.value().id;
    claim_draft.disputed_amount = 50000;
    auto opened = engine.openClaim(tenant, cid, claim_draft);
    if (!check(opened, "openClaim"))
        return 1;
    const std::string claim_id = opened.value().claim.id;
    std::cout << "   contract is now " << contractStatusToString(opened.value().contract_status) << "\n";

    // Finish work completes while the claim freezes the release
    (void)engine.satisfyObligation(tenant, o2.value().id);
    std::cout << "   FINISH is " << milestoneStatusToString(engine.milestone(tenant, m2.value().id).value().status)
              << " (frozen)\n";

    (void)engine.startClaimReview(tenant, claim_id, contractor);
    ClaimResolution resolution;
    resolution.resolution = claim::ResolutionKind::PartialSettlement;
    resolution.settled_amount = 25000;
    resolution.actor = contractor;
    resolution.note = "Doors adjusted, partial credit";
    auto resolved = engine.resolveClaim(tenant, claim_id, resolution);
    if (!check(resolved, "resolveClaim"))
        return 1;
    if (resolved.value().settlement_entry) {
        std::cout << "   ✓ Settled " << amount(25000) << " via entry " << resolved.value().settlement_entry->id
                  << "\n";
    }

    auto closed = engine.closeClaim(tenant, claim_id, homeowner);
    if (!check(closed, "closeClaim"))
        return 1;
    std::cout << "   contract is " << contractStatusToString(closed.value().contract_status) << ", FINISH is "
              << milestoneStatusToString(engine.milestone(tenant, m2.value().id).value().status) << "\n";
    printAccount(engine.ledger().account(tenant, aid).value());
    std::cout << "\n";

    // ===========================================
    // 6. Verification
    // ===========================================

    std::cout << "5. Verifying...\n";
    auto verified = engine.verifyAccount(tenant, aid);
    std::cout << "   snapshot, hash chain and journal agree: " << (verified.is_ok() && verified.value() ? "yes" : "no")
              << "\n";
    std::cout << "   journaled entries: " << store.getEntryCount() << ", claim events: " << store.getClaimEventCount()
              << "\n";

    auto c = engine.contract(tenant, cid).value();
    std::cout << "   committed " << amount(c.committed_amount) << " = released "
              << amount(c.released_amount) << " + forfeited " << amount(c.forfeited_amount)
              << " + remaining " << amount(c.remainingCommitment()) << "\n";

    if (check(engine.completeContract(tenant, cid), "completeContract"))
        std::cout << "   ✓ Contract completed\n";

    std::cout << "\n=== Demo Complete ===\n";
    return 0;
}
