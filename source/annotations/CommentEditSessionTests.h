#ifndef COMMENTEDITSESSIONTESTS_H
#define COMMENTEDITSESSIONTESTS_H

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
 * Unit tests for CommentEditSession.
 * Run with: markupview --test-session
 */
class CommentEditSessionTests : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<MemoryAnnotationStore> m_store;
    std::unique_ptr<AnnotationController> m_controller;
    MarkupAnnotation* m_root = nullptr;
    MarkupAnnotation* m_popup = nullptr;
    AnnotationSettings m_settings;

    std::unique_ptr<CommentEditSession> createSession() {
        return std::make_unique<CommentEditSession>(m_controller.get(), m_popup->ref, m_settings);
    }

    static QVector<AnnotationRef> deletedRefs(const QSignalSpy& spy) {
        QVector<AnnotationRef> refs;
        for (const QList<QVariant>& args : spy) {
            const AnnotationEvent event = args.at(0).value<AnnotationEvent>();
            if (event.type == AnnotationEvent::Type::Deleted) {
                refs.append(event.ref);
            }
        }
        return refs;
    }

private slots:
    void initTestCase() {
        qRegisterMetaType<AnnotationEvent>();
    }

    void init() {
        m_store = std::make_unique<MemoryAnnotationStore>(1);
        m_controller = std::make_unique<AnnotationController>(m_store.get());
        m_root = AnnotationTestFixtures::addComment(*m_store, 0, "Alice", "root");
        m_root->color = QColor(0, 128, 255);
        m_popup = AnnotationTestFixtures::addPopup(*m_store, m_root);

        m_settings = AnnotationSettings();
        m_settings.userName = "Alice";
    }

    void cleanup() {
        m_controller.reset();
        m_store.reset();
    }

    void testInvalidPopup() {
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("not found"));
        CommentEditSession session(m_controller.get(), AnnotationRef(999), m_settings);
        QVERIFY(!session.isValid());
        QVERIFY(!session.editContent("text"));
        QVERIFY(!session.reply("Bob", "text"));
        QCOMPARE(session.deleteSelected(false), 0);
    }

    void testPopupWithoutParent() {
        auto orphan = std::make_unique<MarkupAnnotation>(MarkupAnnotation::Subtype::Popup);
        MarkupAnnotation* popup = m_store->addAnnotation(0, std::move(orphan));

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("has no markup parent"));
        CommentEditSession session(m_controller.get(), popup->ref, m_settings);
        QVERIFY(!session.isValid());
    }

    void testInitialState() {
        auto session = createSession();
        QVERIFY(session->isValid());
        QCOMPARE(session->parentAnnotation(), m_root);
        QCOMPARE(session->popupAnnotation(), m_popup);
        QCOMPARE(session->state().rootAnnotationRef, m_root->ref);
        QCOMPARE(session->state().selectedRef, m_root->ref);
        QCOMPARE(session->selectedAnnotation(), m_root);
        QVERIFY(!session->hasReplies());
        QCOMPARE(session->tree()->child(0)->annotation(), m_root);
    }

    void testSelectNode() {
        auto session = createSession();
        MarkupAnnotation* a = session->reply("Bob", "a");
        QVERIFY(a);

        QSignalSpy changed(session.get(), &CommentEditSession::selectionChanged);
        QVERIFY(!session->selectNode(AnnotationRef(999)));
        QCOMPARE(changed.count(), 0);

        QVERIFY(session->selectNode(m_root->ref));
        QCOMPARE(changed.count(), 1);
        QCOMPARE(session->selectedAnnotation(), m_root);

        // Same selection again: no signal
        QVERIFY(session->selectNode(m_root->ref));
        QCOMPARE(changed.count(), 1);
    }

    void testEditContent() {
        auto session = createSession();
        QSignalSpy events(m_controller.get(), &AnnotationController::annotationEvent);
        const QDateTime before = m_root->modifiedDate;

        QTest::qWait(5);
        QVERIFY(session->editContent("edited"));
        QCOMPARE(m_root->contents, QString("edited"));
        QVERIFY(m_root->modifiedDate > before);
        QVERIFY(m_popup->modifiedDate > before);

        // Updated for the annotation, then for its popup
        QCOMPARE(events.count(), 2);
        QCOMPARE(events.at(0).at(0).value<AnnotationEvent>().ref, m_root->ref);
        QCOMPARE(events.at(1).at(0).value<AnnotationEvent>().ref, m_popup->ref);

        QVERIFY(!session->editContent(QString()));
        QCOMPARE(m_root->contents, QString("edited"));
    }

    void testPrivacy() {
        m_settings.privatePropertyEnabled = true;
        auto session = createSession();
        QVERIFY(session->canTogglePrivacy());

        QVERIFY(session->setPrivacy(true));
        QVERIFY(m_root->isPrivate());
        QVERIFY(session->setPrivacy(false));
        QVERIFY(!m_root->isPrivate());

        // A selected reply still toggles the thread's top-level annotation
        MarkupAnnotation* reply = session->reply("Alice", "follow-up");
        QVERIFY(reply);
        QCOMPARE(session->selectedAnnotation(), reply);
        QSignalSpy events(m_controller.get(), &AnnotationController::annotationEvent);
        QVERIFY(session->setPrivacy(true));
        QVERIFY(m_root->isPrivate());
        QVERIFY(!reply->isPrivate());
        QCOMPARE(events.count(), 2);
        QCOMPARE(events.at(0).at(0).value<AnnotationEvent>().ref, m_root->ref);
        QCOMPARE(events.at(1).at(0).value<AnnotationEvent>().ref, m_popup->ref);

        m_settings.userName = "Bob";
        auto other = createSession();
        QVERIFY(!other->canTogglePrivacy());

        m_settings.userName = "Alice";
        m_settings.privatePropertyEnabled = false;
        auto disabled = createSession();
        QVERIFY(!disabled->canTogglePrivacy());
    }

    void testReply() {
        auto session = createSession();
        QSignalSpy rebuilt(session.get(), &CommentEditSession::threadRebuilt);
        QSignalSpy events(m_controller.get(), &AnnotationController::annotationEvent);

        MarkupAnnotation* reply = session->reply("Bob", "Looks good");
        QVERIFY(reply);

        QCOMPARE(reply->inReplyTo, m_root->ref);
        QCOMPARE(reply->titleText, QString("Bob"));
        QCOMPARE(reply->contents, QString("Looks good"));
        QCOMPARE(reply->color, m_root->color);
        QCOMPARE(reply->stateModel, MarkupAnnotation::STATE_MODEL_REVIEW);
        QCOMPARE(reply->state, MarkupAnnotation::STATE_REVIEW_NONE);
        QVERIFY(!reply->open);
        QVERIFY(!reply->isPrivate());
        QCOMPARE(reply->pageIndex, 0);

        QVERIFY(session->hasReplies());
        QCOMPARE(session->selectedAnnotation(), reply);
        QCOMPARE(session->tree()->find(reply->ref)->parent()->annotation(), m_root);
        QCOMPARE(rebuilt.count(), 1);
        QCOMPARE(rebuilt.at(0).at(0).toBool(), true);

        QCOMPARE(events.count(), 1);
        const AnnotationEvent added = events.at(0).at(0).value<AnnotationEvent>();
        QVERIFY(added.type == AnnotationEvent::Type::Added);
        QCOMPARE(added.ref, reply->ref);
    }

    void testReplyPrivateByDefault() {
        m_settings.publicByDefault = false;
        auto session = createSession();
        MarkupAnnotation* reply = session->reply("Bob", "secret");
        QVERIFY(reply);
        QVERIFY(reply->isPrivate());
    }

    void testReviewStatus() {
        auto session = createSession();
        MarkupAnnotation* status = session->setReviewStatus(
            "Bob", "Status of %1: accepted", MarkupAnnotation::STATE_REVIEW_ACCEPTED);
        QVERIFY(status);
        QCOMPARE(status->titleText, QString("Bob"));
        QCOMPARE(status->contents, QString("Status of Alice: accepted"));
        QCOMPARE(status->state, MarkupAnnotation::STATE_REVIEW_ACCEPTED);
        QCOMPARE(status->stateModel, MarkupAnnotation::STATE_MODEL_REVIEW);
        QCOMPARE(status->inReplyTo, m_root->ref);
    }

    void testReplyChainAndDeletion() {
        auto session = createSession();
        CommentThreadSynchronizer sync(m_controller.get(), session.get());

        // Bob replies to Alice, Carol replies to Bob
        MarkupAnnotation* a = session->reply("Bob", "a");
        QVERIFY(a);
        const AnnotationRef aRef = a->ref;
        MarkupAnnotation* b = session->reply("Carol", "b");
        QVERIFY(b);
        const AnnotationRef bRef = b->ref;

        const CommentThreadNode* top = session->tree()->child(0);
        QCOMPARE(top->childCount(), 1);
        QCOMPARE(top->child(0)->ref(), aRef);
        QCOMPARE(top->child(0)->child(0)->ref(), bRef);

        // Rebuilding from the store gives the same tree
        session->rebuild();
        QCOMPARE(session->tree()->refs(), (QVector<AnnotationRef>{ m_root->ref, aRef, bRef }));

        QSignalSpy events(m_controller.get(), &AnnotationController::annotationEvent);
        QVERIFY(session->selectNode(aRef));
        QCOMPARE(session->deleteSelected(false), 2);

        // Deepest first
        QCOMPARE(deletedRefs(events), (QVector<AnnotationRef>{ bRef, aRef }));
        QVERIFY(!m_store->annotation(aRef));
        QVERIFY(!m_store->annotation(bRef));
        QVERIFY(m_store->annotation(m_root->ref));
        QVERIFY(!session->hasReplies());
        QCOMPARE(session->tree()->annotationCount(), 1);
        QCOMPARE(session->selectedAnnotation(), m_root);
    }

    void testDeleteWholeThread() {
        auto session = createSession();
        const AnnotationRef rootRef = m_root->ref;
        const AnnotationRef popupRef = m_popup->ref;

        MarkupAnnotation* a = session->reply("Bob", "a");
        QVERIFY(a);
        QVERIFY(session->selectNode(rootRef));
        MarkupAnnotation* c = session->reply("Carol", "c");
        QVERIFY(c);

        QSignalSpy events(m_controller.get(), &AnnotationController::annotationEvent);
        QCOMPARE(session->deleteSelected(true), 3);

        const QVector<AnnotationRef> deleted = deletedRefs(events);
        QCOMPARE(deleted.size(), 4);
        // Top-level annotation last, its popup just before it
        QCOMPARE(deleted.at(2), popupRef);
        QCOMPARE(deleted.at(3), rootRef);
        QCOMPARE(m_store->count(), 0);

        QCOMPARE(session->tree()->childCount(), 0);
        QVERIFY(!session->selectedAnnotation());
    }

    void testDeleteThreadCascadesThroughGrandchildren() {
        // R -> {A, B}, A -> {C}
        MarkupAnnotation* a = AnnotationTestFixtures::addComment(*m_store, 0, "Bob", "a", m_root->ref);
        MarkupAnnotation* b = AnnotationTestFixtures::addComment(*m_store, 0, "Carol", "b", m_root->ref);
        MarkupAnnotation* c = AnnotationTestFixtures::addComment(*m_store, 0, "Dave", "c", a->ref);
        const AnnotationRef rootRef = m_root->ref;
        const AnnotationRef aRef = a->ref;
        const AnnotationRef bRef = b->ref;
        const AnnotationRef cRef = c->ref;

        auto session = createSession();
        QCOMPARE(session->tree()->refs(), (QVector<AnnotationRef>{ rootRef, aRef, cRef, bRef }));

        QSignalSpy events(m_controller.get(), &AnnotationController::annotationEvent);
        QCOMPARE(session->deleteSelected(true), 4);

        const QVector<AnnotationRef> deleted = deletedRefs(events);
        QVERIFY(deleted.contains(cRef));
        QVERIFY(deleted.contains(bRef));
        QVERIFY(deleted.indexOf(cRef) < deleted.indexOf(aRef));
        QCOMPARE(deleted.last(), rootRef);
        QCOMPARE(m_store->count(), 0);
        QCOMPARE(session->tree()->childCount(), 0);
        QVERIFY(!session->hasReplies());
    }

    void testRebuildKeepsSelection() {
        auto session = createSession();
        MarkupAnnotation* a = session->reply("Bob", "a");
        QVERIFY(a);
        QVERIFY(session->selectNode(a->ref));

        // Added behind the session's back, then picked up by a rebuild
        AnnotationTestFixtures::addComment(*m_store, 0, "Carol", "late", m_root->ref);
        QSignalSpy changed(session.get(), &CommentEditSession::selectionChanged);
        session->rebuild();

        QCOMPARE(session->state().selectedRef, a->ref);
        QCOMPARE(session->selectedAnnotation(), a);
        QCOMPARE(changed.count(), 0);
        QCOMPARE(session->tree()->annotationCount(), 3);

        // Once the selection is gone the top-level annotation takes over
        const AnnotationRef aRef = a->ref;
        QVERIFY(m_store->removeAnnotation(aRef));
        session->rebuild();
        QCOMPARE(session->state().selectedRef, m_root->ref);
        QCOMPARE(changed.count(), 1);
    }

    void testSelectionFallsBackToTopLevel() {
        auto session = createSession();
        MarkupAnnotation* a = session->reply("Bob", "a");
        QVERIFY(a);
        QCOMPARE(session->selectedAnnotation(), a);

        // Removed behind the session's back
        QVERIFY(m_store->removeAnnotation(a->ref));
        QCOMPARE(session->selectedAnnotation(), m_root);
    }

    void testReplyToStaleSelectionGoesToTopLevel() {
        auto session = createSession();
        MarkupAnnotation* a = session->reply("Bob", "a");
        QVERIFY(a);
        const AnnotationRef aRef = a->ref;
        QVERIFY(m_store->removeAnnotation(aRef));

        // The selection resolves to the top-level annotation
        MarkupAnnotation* b = session->reply("Carol", "b");
        QVERIFY(b);
        QCOMPARE(b->inReplyTo, m_root->ref);
        QCOMPARE(session->tree()->find(b->ref)->parent()->annotation(), m_root);
    }

    void testMinimize() {
        m_popup->open = true;
        auto session = createSession();
        QSignalSpy minimized(session.get(), &CommentEditSession::minimized);

        QVERIFY(session->minimize());
        QVERIFY(!m_popup->open);
        QCOMPARE(minimized.count(), 1);
    }

    void testFontSizes() {
        auto session = createSession();
        QVERIFY(session->setFontSizes(16, 14));
        QCOMPARE(m_popup->textAreaFontSize, 16.0);
        QCOMPARE(m_popup->headerFontSize, 14.0);
        QVERIFY(!session->setFontSizes(16, 14));
        QVERIFY(!session->setFontSizes(0, 14));
    }
};

#endif // COMMENTEDITSESSIONTESTS_H
