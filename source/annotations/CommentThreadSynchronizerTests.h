#ifndef COMMENTTHREADSYNCHRONIZERTESTS_H
#define COMMENTTHREADSYNCHRONIZERTESTS_H

#include <QObject>
#include <QRegularExpression>
#include <QSignalSpy>
#include <QTest>

#include "AnnotationController.h"
#include "AnnotationTestFixtures.h"
#include "CommentEditSession.h"
#include "CommentThreadSynchronizer.h"
#include "MemoryAnnotationStore.h"

/**
 * Unit tests for CommentThreadSynchronizer and ThreadColorPropagator.
 * Run with: markupview --test-sync
 *
 * Each test works on a two-page store with one thread on page 0:
 * the top-level comment "root" by Alice and its popup window.
 */
class CommentThreadSynchronizerTests : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<MemoryAnnotationStore> m_store;
    std::unique_ptr<AnnotationController> m_controller;
    std::unique_ptr<CommentEditSession> m_session;
    std::unique_ptr<CommentThreadSynchronizer> m_sync;
    MarkupAnnotation* m_root = nullptr;
    MarkupAnnotation* m_popup = nullptr;

    MarkupAnnotation* addReply(const QString& title, const AnnotationRef& irt, int page = 0) {
        auto annot = std::make_unique<MarkupAnnotation>(MarkupAnnotation::Subtype::Text);
        annot->titleText = title;
        annot->contents = title + " says hi";
        annot->inReplyTo = irt;
        return m_controller->addAnnotation(page, std::move(annot));
    }

private slots:
    void init() {
        m_store = std::make_unique<MemoryAnnotationStore>(2);
        m_controller = std::make_unique<AnnotationController>(m_store.get());
        m_root = AnnotationTestFixtures::addComment(*m_store, 0, "Alice", "root");
        m_popup = AnnotationTestFixtures::addPopup(*m_store, m_root);

        AnnotationSettings settings;
        settings.userName = "Alice";
        m_session = std::make_unique<CommentEditSession>(m_controller.get(), m_popup->ref, settings);
        m_sync = std::make_unique<CommentThreadSynchronizer>(m_controller.get(), m_session.get());
        QVERIFY(m_session->isValid());
    }

    void cleanup() {
        m_sync.reset();
        m_session.reset();
        m_controller.reset();
        m_store.reset();
    }

    void testDirectReplyRebuilds() {
        QSignalSpy rebuilt(m_session.get(), &CommentEditSession::threadRebuilt);

        MarkupAnnotation* a = addReply("Bob", m_root->ref);

        QCOMPARE(rebuilt.count(), 1);
        QVERIFY(m_session->tree()->contains(a->ref));
        QVERIFY(m_session->hasReplies());
    }

    void testIndirectReplyRebuilds() {
        MarkupAnnotation* a = addReply("Bob", m_root->ref);
        QSignalSpy rebuilt(m_session.get(), &CommentEditSession::threadRebuilt);

        MarkupAnnotation* b = addReply("Carol", a->ref);

        QCOMPARE(rebuilt.count(), 1);
        QVERIFY(m_session->tree()->contains(b->ref));
        QCOMPARE(m_session->tree()->find(b->ref)->parent()->annotation(), a);
    }

    void testRebuildFromOtherViewKeepsSelection() {
        MarkupAnnotation* a = addReply("Bob", m_root->ref);
        QVERIFY(m_session->selectNode(a->ref));
        QSignalSpy rebuilt(m_session.get(), &CommentEditSession::threadRebuilt);
        QSignalSpy changed(m_session.get(), &CommentEditSession::selectionChanged);

        // Another view replies to the top-level annotation
        MarkupAnnotation* d = addReply("Dave", m_root->ref);

        QCOMPARE(rebuilt.count(), 1);
        QVERIFY(m_session->tree()->contains(d->ref));
        QCOMPARE(m_session->state().selectedRef, a->ref);
        QCOMPARE(changed.count(), 0);

        // An edit still lands on the selected reply
        QVERIFY(m_session->editContent("typed into the reply"));
        QCOMPARE(a->contents, QString("typed into the reply"));
        QCOMPARE(m_root->contents, QString("root"));
    }

    void testDeletingSelectionFallsBackToTopLevel() {
        MarkupAnnotation* a = addReply("Bob", m_root->ref);
        const AnnotationRef aRef = a->ref;
        addReply("Carol", m_root->ref);
        QVERIFY(m_session->selectNode(aRef));

        QVERIFY(m_controller->deleteAnnotation(aRef));
        QCOMPARE(m_session->state().selectedRef, m_root->ref);
        QVERIFY(m_session->hasReplies());
    }

    void testUnrelatedAddIsIgnored() {
        QSignalSpy rebuilt(m_session.get(), &CommentEditSession::threadRebuilt);

        MarkupAnnotation* s = addReply("Eve", AnnotationRef());
        addReply("Eve", s->ref);
        addReply("Mallory", m_root->ref, 1);   // same IRT, other page

        QCOMPARE(rebuilt.count(), 0);
        QCOMPARE(m_session->tree()->annotationCount(), 1);
    }

    void testDeletingMemberRebuilds() {
        MarkupAnnotation* a = addReply("Bob", m_root->ref);
        const AnnotationRef aRef = a->ref;
        QSignalSpy rebuilt(m_session.get(), &CommentEditSession::threadRebuilt);

        QVERIFY(m_controller->deleteAnnotation(aRef));

        QCOMPARE(rebuilt.count(), 1);
        QVERIFY(!m_session->tree()->contains(aRef));
        QVERIFY(!m_session->hasReplies());
    }

    void testDeletingNonMemberIsIgnored() {
        MarkupAnnotation* s = addReply("Eve", AnnotationRef());
        QSignalSpy rebuilt(m_session.get(), &CommentEditSession::threadRebuilt);

        QVERIFY(m_controller->deleteAnnotation(s->ref));
        QCOMPARE(rebuilt.count(), 0);
    }

    void testRequiresRebuildPrecision() {
        MarkupAnnotation* a = addReply("Bob", m_root->ref);

        QVERIFY(m_sync->requiresRebuild(AnnotationEvent::deleted(0, a->ref, m_root->ref)));
        QVERIFY(m_sync->requiresRebuild(AnnotationEvent::deleted(0, m_root->ref, AnnotationRef())));
        QVERIFY(!m_sync->requiresRebuild(AnnotationEvent::deleted(1, a->ref, m_root->ref)));
        QVERIFY(!m_sync->requiresRebuild(AnnotationEvent::deleted(0, AnnotationRef(999), AnnotationRef())));

        // Already a member: nothing to add
        QVERIFY(!m_sync->requiresRebuild(AnnotationEvent::added(0, a->ref)));
        // Not in the store at all
        QVERIFY(!m_sync->requiresRebuild(AnnotationEvent::added(0, AnnotationRef(999))));
        QVERIFY(!m_sync->requiresRebuild(AnnotationEvent::updated(0, a->ref)));
    }

    void testColorConverges() {
        MarkupAnnotation* a = addReply("Bob", m_root->ref);
        MarkupAnnotation* b = addReply("Carol", a->ref);
        QSignalSpy refresh(m_session.get(), &CommentEditSession::displayRefreshRequested);

        b->color = QColor(Qt::red);
        m_controller->updateAnnotation(b);

        QCOMPARE(m_root->color, QColor(Qt::red));
        QCOMPARE(a->color, QColor(Qt::red));
        QCOMPARE(b->color, QColor(Qt::red));
        QVERIFY(refresh.count() >= 1);
    }

    void testColorOfOtherThreadUntouched() {
        MarkupAnnotation* s = addReply("Eve", AnnotationRef());
        const QColor before = m_root->color;

        s->color = QColor(Qt::blue);
        m_controller->updateAnnotation(s);

        QCOMPARE(m_root->color, before);
    }

    void testCyclicChainIsUnrelated() {
        // Stored without events, then linked into a loop
        MarkupAnnotation* x = AnnotationTestFixtures::addComment(*m_store, 0, "X", "x");
        MarkupAnnotation* y = AnnotationTestFixtures::addComment(*m_store, 0, "Y", "y", x->ref);
        x->inReplyTo = y->ref;

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Cyclic IRT chain"));
        QVERIFY(!m_sync->repliesIntoThread(x->ref));

        QSignalSpy rebuilt(m_session.get(), &CommentEditSession::threadRebuilt);
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Cyclic IRT chain"));
        m_controller->publish(AnnotationEvent::added(0, x->ref));
        QCOMPARE(rebuilt.count(), 0);
    }

    void testEventsAreDeliveredInOrder() {
        QVector<QPair<int, int>> seen;   // (receiver, object number)
        const AnnotationRef first(501);
        const AnnotationRef second(502);

        QObject receiverA;
        QObject receiverB;
        connect(m_controller.get(), &AnnotationController::annotationEvent, &receiverA,
                [&](const AnnotationEvent& event) {
                    seen.append(qMakePair(1, event.ref.objectNumber));
                    if (event.ref == first) {
                        m_controller->publish(AnnotationEvent::updated(1, second));
                    }
                });
        connect(m_controller.get(), &AnnotationController::annotationEvent, &receiverB,
                [&](const AnnotationEvent& event) {
                    QVERIFY(m_controller->isDispatching());
                    seen.append(qMakePair(2, event.ref.objectNumber));
                });

        m_controller->publish(AnnotationEvent::updated(1, first));

        const QVector<QPair<int, int>> expected = {
            qMakePair(1, 501), qMakePair(2, 501), qMakePair(1, 502), qMakePair(2, 502)
        };
        QCOMPARE(seen, expected);
        QVERIFY(!m_controller->isDispatching());
    }

    void testSummaryFromOtherViews() {
        int self = 0;
        int other = 0;
        m_sync->setSummarySource(&self);
        QSignalSpy received(m_sync.get(), &CommentThreadSynchronizer::summaryReceived);

        m_controller->publish(AnnotationEvent::summaryUpdated(0, m_popup->ref, "mine", false, &self));
        QCOMPARE(received.count(), 0);

        m_controller->publish(AnnotationEvent::summaryUpdated(0, m_popup->ref, "theirs", true, &other));
        QCOMPARE(received.count(), 1);
        QCOMPARE(received.at(0).at(0).toString(), QString("theirs"));
        QCOMPARE(received.at(0).at(1).toBool(), true);

        // Another popup's summary
        m_controller->publish(AnnotationEvent::summaryUpdated(0, m_root->ref, "x", false, &other));
        QCOMPARE(received.count(), 1);
    }
};

#endif // COMMENTTHREADSYNCHRONIZERTESTS_H
